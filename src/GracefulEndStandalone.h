/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#ifndef GRACEFULEND_STANDALONE_H
#define GRACEFULEND_STANDALONE_H

#include "PluvialInclude.h"

/////////////////////////////////////////////////////////////////
/// \brief Finalizes program gracefully, explaining reason for finalizing
/// \remark Called from main() upon completion, or upon catching an exception raised by ExitGracefully()
///
/// \param statement [in] String to print to user upon exit
/// \param code [in] Code to determine why the system is exiting
/// \param &Options [in] global program options
/// \return program exit status (0 if analysis is complete)
//
inline int FinalizeGracefully(const char *statement, exitcode code, const optStruct &Options)
{
  string typeline;
  switch (code){
    case(SIMULATION_DONE): {typeline="============================================================";break;}
    case(RUNTIME_ERR):     {typeline="Error Type: Runtime Error";       break;}
    case(BAD_DATA):        {typeline="Error Type: Bad input data";      break;}
    case(BAD_DATA_WARN):   {typeline="Error Type: Bad input data";      break;}
    case(OUT_OF_MEMORY):   {typeline="Error Type: Out of memory";       break;}
    case(FILE_OPEN_ERR):   {typeline="Error Type: File opening error";  break;}
    case(STUB):            {typeline="Error Type: Stub function called";break;}
    default:               {typeline="Error Type: Unknown";             break;}
  }

  if (code != PLUVIAL_OPEN_ERR) { //errors file cannot be reopened
    ofstream WARNINGS;
    WARNINGS.open((Options.main_output_dir+"Pluvial_errors.txt").c_str(),ios::app);
    if (WARNINGS.fail()) {
      cerr<<"ERROR    : Unable to open errors file ("<<Options.main_output_dir<<"Pluvial_errors.txt)"<<endl;
    }
    else {
      if (code!=SIMULATION_DONE) {WARNINGS<<"ERROR    : "<< statement << endl;
                                  cerr    <<"ERROR    : "<< statement << endl;}
      else                       {WARNINGS<<"ANALYSIS COMPLETE :)"<<endl;}
      WARNINGS.close();
    }
  }

  if (!Options.silent || (code!=SIMULATION_DONE)){
    cout <<endl<<endl;
    cout <<"============== Exiting Gracefully =========================="<<endl;
    cout <<"Exiting Gracefully: "<<statement                             <<endl;
    cout << typeline                                                     <<endl;
    cout <<"============================================================"<<endl;
  }

  if(Options.pause) {
    cout << "Press the ENTER key to continue"<<endl;
    cin.get();
  }
  if (code==SIMULATION_DONE){return 0;}
  return (int)(code);
}

#endif
