/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  ParseLib.h
  ------------------------------------------------------------------
  Line-based tokenizing parser for :Command style input files
  ----------------------------------------------------------------*/
#ifndef PARSELIB_H
#define PARSELIB_H

#include "PluvialInclude.h"

const bool parserdebug=false; ///< echoes every line read if true

///////////////////////////////////////////////////////////////////
/// \brief parsing result codes
//
enum parse_error
{
  PARSE_BAD,        ///< improper line format
  PARSE_NOT_ENOUGH, ///< too few items
  PARSE_TOO_MANY,   ///< too many items
  PARSE_GOOD,       ///< good line
  PARSE_EOF         ///< end of file reached
};

///////////////////////////////////////////////////////////////////
/// \brief Tokenizes and reads lines of an open input file
//
class CParser
{
private:
  ifstream *_INPUT;    ///< input stream (not owned)
  string    _filename; ///< name of file being read (for error messages)
  int       _lineno;   ///< current line number

public:
  CParser(ifstream &FILE, const int i);
  CParser(ifstream &FILE, string filename, const int i);

  bool        Tokenize      (char **out, int &numwords);
  string      Peek          ();
  void        SkipLine      ();
  void        ImproperFormat(char **s);

  void        SetLineCounter(int i);
  int         GetLineNumber ();
  string      GetFilename   ();

  parse_error Parse_dbl     (double &v1);
  parse_error Parse_dbl     (double &v1, double &v2);
  parse_error ParseColumns_dbldbl(vector<double> &v1, vector<double> &v2, const string &endtag);
};

#endif
