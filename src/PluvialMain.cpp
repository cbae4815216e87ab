/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include <time.h>
#include "PluvialInclude.h"
#include "PluvialMain.h"
#include "DistributionRegistry.h"
#include "GracefulEndStandalone.h"

static string PluvialBuildDate(__DATE__);

//////////////////////////////////////////////////////////////////
//
/// \brief Primary Pluvial driver routine
//
/// \param argc [in] number of arguments to executable
/// \param argv[] [in] executable arguments; Pluvial.exe [base_filename] [-o output_dir] [-r run_name] [-d data_dir] [-s] [-n] [-v]
/// \return Success of main method
//
int main(int argc, char* argv[])
{
  clock_t     t0;
  optStruct   Options;

  Options.version=__PLUVIAL_VERSION__;
  Options.silent =false;
  Options.noisy  =false;
  Options.pause  =false;

  try
  {
    ProcessExecutableArguments(argc,argv,Options);
    PrepareOutputdirectory(Options);

    if (!Options.silent){
      int year = s_to_i(PluvialBuildDate.substr(PluvialBuildDate.length()-4,4).c_str());
      cout <<"============================================================"<<endl;
      cout <<"                        PLUVIAL                             "<<endl;
      cout <<"    design storm and peak flow analysis for small basins    "<<endl;
      cout <<"   Copyright 2024-"<<year<<", the Pluvial Development Team "  <<endl;
      cout <<"                    Version "<<Options.version               <<endl;
      cout <<"                BuildDate "<<PluvialBuildDate                <<endl;
      cout <<"============================================================"<<endl;
    }

    ofstream WARNINGS;
    WARNINGS.open((Options.main_output_dir+"Pluvial_errors.txt").c_str());
    if (WARNINGS.fail()){
      ExitGracefully("Main::Unable to open Pluvial_errors.txt. Bad output directory specified?",PLUVIAL_OPEN_ERR);
    }
    WARNINGS.close();

    t0=clock();

    //Read input file, set analysis options
    basin_params     basin;
    analysis_options AO;
    if (!ParseAnalysisFile(basin,AO,Options)){
      ExitGracefully("Main::Unable to read input file "+Options.rvs_filename,BAD_DATA);}

    CheckForErrorWarnings(false,Options);

    if (Options.data_dir==""){Options.data_dir=CDistributionRegistry::GetDefaultDataDirectory();}
    CDistributionRegistry Registry(Options.data_dir);

    if (!Options.silent){
      cout <<"======================================================"<<endl;
      cout <<"Running analyses..."<<endl;
    }
    CAnalysisRunner Runner(basin,AO,Registry);
    Runner.Run();

    WriteAnalysisOutput(Runner,Options);
    SummarizeToScreen  (basin,Runner,Options);

    if (!Options.silent)
    {
      cout <<"======================================================"<<endl;
      cout <<"...Pluvial Analysis Complete: "<<Options.run_name<<endl;
      cout <<"    "<<Runner.GetNumRuns()<<" analyses: "<< float(clock()-t0)/CLOCKS_PER_SEC << " seconds elapsed . "<<endl;
      if(Options.output_dir!="") {
        cout <<"  Output written to "        << Options.output_dir <<endl;
      }
      cout <<"======================================================"<<endl;
    }
  }
  catch (const CPluvialException &e)
  {
    return FinalizeGracefully(e.what(),e.GetCode(),Options);
  }
  return FinalizeGracefully("Successful Analysis",SIMULATION_DONE,Options);
}

//////////////////////////////////////////////////////////////////
/// \param argc [in] number of arguments to executable
/// \param argv[] [in] executable arguments; Pluvial.exe [filebase] [-o output_dir] [-r run_name] [-d data_dir]
/// \details initializes input file and output directory
/// \details filebase has no extension; the .rvs extension is appended
/// \param Options [out] Global program options
//
void ProcessExecutableArguments(int argc, char* argv[], optStruct &Options)
{
  int i=1;
  string word,argument;
  bool version_announce=false;
  int mode=0;
  argument="";
  //initialization:
  Options.run_name       ="";
  Options.rvs_filename   ="";
  Options.data_dir       ="";
  Options.output_dir     ="";
  Options.main_output_dir="";
  Options.silent=false;
  Options.noisy =false;
  Options.pause =false;

  //Parse argument list
  while (i<=argc)
  {
    if (i!=argc){
      word=string(argv[i]);
    }
    if ((word=="-o") || (word=="-r") || (word=="-d") || (word=="-s") || (word=="-n") ||
        (word=="-v") || (word=="-p") || (i==argc))
    {
      if      (mode==0){
        if (argument!=""){Options.rvs_filename=argument+".rvs";}
        argument="";
        mode=10;
      }
      else if (mode==1){Options.output_dir=argument; argument="";}
      else if (mode==2){Options.run_name  =argument; argument="";}
      else if (mode==3){Options.data_dir  =argument; argument="";}

      if      (word=="-o"){mode=1; }
      else if (word=="-r"){mode=2; }
      else if (word=="-d"){mode=3; }
      else if (word=="-s"){Options.silent=true; mode=10;}
      else if (word=="-n"){Options.noisy =true; mode=10;}
      else if (word=="-p"){Options.pause =true; mode=10;}
      else if (word=="-v"){version_announce=true; mode=10;}
    }
    else{
      if (argument==""){argument+=word;}
      else             {argument+=" "+word;}
    }
    i++;
  }
  if (Options.rvs_filename==""){//no arguments
    Options.rvs_filename="nobasin.rvs";
  }

  // make sure that output dir has trailing '/' if not empty
  if ((Options.output_dir.compare("") != 0) && (Options.output_dir[Options.output_dir.length()-1]!='/')){ Options.output_dir=Options.output_dir+"/"; }

  Options.main_output_dir=Options.output_dir;

  if(version_announce) {
    cout<<Options.version<<endl;
    ExitGracefully("Version check",SIMULATION_DONE);
  }
}
