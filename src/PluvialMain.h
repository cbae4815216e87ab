/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#ifndef PLUVIAL_MAIN
#define PLUVIAL_MAIN

#include "PluvialInclude.h"
#include "AnalysisRun.h"

//Defined in ParseInput.cpp
bool   ParseAnalysisFile         (basin_params &basin, analysis_options &AO, const optStruct &Options);

//Defined in StandardOutput.cpp
void   PrepareOutputdirectory    (const optStruct &Options);
string FilenamePrepare           (string filebase, const optStruct &Options);
void   CheckForErrorWarnings     (bool quiet, const optStruct &Options);
void   WriteAnalysisOutput       (const CAnalysisRunner &Runner, const optStruct &Options);
void   SummarizeToScreen         (const basin_params &basin, const CAnalysisRunner &Runner, const optStruct &Options);

//Defined in PluvialMain.cpp
void   ProcessExecutableArguments(int argc, char* argv[], optStruct &Options);

#endif
