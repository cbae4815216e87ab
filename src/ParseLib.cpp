/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/

#include "ParseLib.h"

/*----------------------------------------------------------------
  Constructor
  -----------------------------------------------------------------------*/
CParser::CParser(ifstream &FILE, const int i)
{
  _filename="";
  _INPUT =&FILE;
  _lineno=i;
}
//-----------------------------------------------------------------------
CParser::CParser(ifstream &FILE, string filename, const int i)
{
  _filename=filename;
  _INPUT =&FILE;
  _lineno=i;
}
/*----------------------------------------------------------------
  Basic Member Functions
  -----------------------------------------------------------------------*/
void   CParser::SetLineCounter(int i)    {_lineno=i;}
//-----------------------------------------------------------------------
int    CParser::GetLineNumber ()         {return _lineno;}
//-----------------------------------------------------------------------
string CParser::GetFilename   ()         {return _filename;}
//-----------------------------------------------------------------------
string CParser::Peek()
{
  // return first word of current line in INPUT without proceeding forward in the file
  std::streampos place;
  int Len=0;
  char *s[MAXINPUTITEMS];

  if (_INPUT->eof()){return ""; }
  place=_INPUT->tellg(); // Get current position
  Tokenize(s,Len);       //read and parse whole line
  _lineno--;             //otherwise line number incremented upon peeking

  string firstword = "";
  if (Len > 0) {firstword=s[0];}
  _INPUT->clear();
  _INPUT->seekg(place ,std::ios_base::beg);    // Return to position before peeked line
  return firstword;
}
/*----------------------------------------------------------------
  Tokenize
  ----------------------------------------------------------------
  tokenizes a sentence delimited by  spaces, tabs, commas & return characters

  parameters:
  out is the array of strings in the line
  numwords is the number of strings in the line
  returns true if file has ended
  -------------------------------------------------------------------------*/
bool CParser::Tokenize(char **out, int &numwords)
{
  static char wholeline     [MAXCHARINLINE];
  static char *tempwordarray[MAXINPUTITEMS];
  char *p;
  int ct(0),w;
  char delimiters[6];
  delimiters[0]=' '; //space
  delimiters[1]='\t';//tab
  delimiters[2]=','; //comma
  delimiters[3]='\r';//carriage return
  delimiters[4]='\n';//newline
  delimiters[5]='\0';//last delimiter

  numwords=0;
  (*wholeline)=0;
  if (_INPUT->eof()){return true;}
  _INPUT->getline(wholeline,MAXCHARINLINE);            //get entire line as 1 string
  if (_INPUT->fail()){
    return true; //handles blank line peeked at end of file
  }

  _lineno++;
  if ((parserdebug) && ((*wholeline)!=0)){cout <<wholeline<<endl;}

  if ((*wholeline) == 0) {
    return false;
  }

  p=strtok(wholeline, delimiters);
  while (p){                                         //sift through words, place in temparray, count line length
    if (p[0]=='#'){break;}                           //ignore all content after '#'
    if (ct>=MAXINPUTITEMS){
      string warn="Tokenize:: exceeded maximum number of items in single line in file "+_filename;
      ExitGracefully(warn.c_str(),BAD_DATA);
      return true;
    }
    tempwordarray[ct]=p;
    p=strtok(NULL, delimiters);
    ct++;
  }
  for (w=0; w<ct; w++){                              //copy temp array of words into out[]
    out[w]=tempwordarray[w];
  }
  numwords=ct;
  return false;
}
/*----------------------------------------------------------------*/
void   CParser::ImproperFormat(char **s)
{
  string warn="line "+to_string(_lineno)+" in file "+_filename+" is wrong length ("+string(s[0])+")";
  WriteWarning(warn,false);
}
/*----------------------------------------------------------------*/
void CParser::SkipLine()
{
  int      Len;
  char    *s[MAXINPUTITEMS];
  if (Tokenize(s,Len)){}
}
/*----------------------------------------------------------------
  Parse_dbl
  ----------------------------------------------------------------
  Parses a single line from an input file expected to have 1 or 2 DOUBLE
  input parameters
  ----------------------------------------------------------------*/
parse_error CParser::Parse_dbl(double &v1)
{
  int      Len;
  char    *s[MAXINPUTITEMS];

  if (Tokenize(s,Len))                     {return PARSE_EOF;   }

  if      (Len==1) {v1=s_to_d(s[0]);                              return PARSE_GOOD;}
  else if (Len==0) {                                              return PARSE_NOT_ENOUGH;}
  else             {ImproperFormat(s);            return PARSE_BAD;       }
}
//------------------------------------------------------------------------------
parse_error CParser::Parse_dbl(double &v1, double &v2)
{
  int      Len;
  char    *s[MAXINPUTITEMS];

  if (Tokenize(s,Len))                     {return PARSE_EOF;   }

  if      (Len==2) {v1=s_to_d(s[0]);
    v2=s_to_d(s[1]);                                return PARSE_GOOD;}
  else if (Len==0) {                                return PARSE_NOT_ENOUGH;}
  else             {ImproperFormat(s);            return PARSE_BAD;       }
}
/*-------------------------------------------------------------------------
  ParseColumns_dbldbl
  -------------------------------------------------------------------------
  Parses an arbitrary number of two-column lines, ended by endtag
  Ex.:
  0.0  1.2
  5.0  3.4
  :EndCustomHyetograph
  -------------------------------------------------------------------------*/
parse_error CParser::ParseColumns_dbldbl(vector<double> &v1, vector<double> &v2, const string &endtag)
{
  bool   done(false);
  int    Len;
  char  *s[MAXINPUTITEMS];

  v1.clear();
  v2.clear();
  do
  {
    if (Tokenize(s,Len)){return PARSE_EOF;}
    if      (Len==0)                 {}//blank line
    else if (!strcmp(s[0],endtag.c_str())){done=true;}
    else if (Len==2)
    {
      if (!StringIsDouble(s[0]) || !StringIsDouble(s[1])){ImproperFormat(s);return PARSE_BAD;}
      v1.push_back(s_to_d(s[0]));
      v2.push_back(s_to_d(s[1]));
    }
    else
    {
      ImproperFormat(s);
      return PARSE_BAD;
    }
  } while (!done);

  return PARSE_GOOD;
}
