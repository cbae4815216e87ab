/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team

  Includes routines for preparing and writing analysis output:
    PrepareOutputdirectory()
    FilenamePrepare()
    CheckForErrorWarnings()
    WriteAnalysisOutput()
    SummarizeToScreen()
  ----------------------------------------------------------------*/
#include "PluvialInclude.h"
#include "PluvialMain.h"
#include "ParseLib.h"

#if defined(_WIN32)
#include <direct.h>
#elif defined(__linux__)
#include <sys/stat.h>
#elif defined(__unix__)
#include <sys/stat.h>
#elif defined(__APPLE__)
#include <sys/stat.h>
#endif

//////////////////////////////////////////////////////////////////
/// \brief Adds run name and output directory to output file name
/// \param filebase [in] base file name, e.g., "summary.csv"
/// \param &Options [in] global program options
/// \return full path of output file
//
string FilenamePrepare(string filebase, const optStruct &Options)
{
  string fn;
  if (Options.run_name==""){fn=Options.output_dir+filebase;}
  else                     {fn=Options.output_dir+Options.run_name+"_"+filebase;}
  return fn;
}

//////////////////////////////////////////////////////////////////
/// \brief creates specified output directory, if needed
///
/// \param &Options [in] global program options
//
void PrepareOutputdirectory(const optStruct &Options)
{
  if (Options.output_dir!="")
  {
#if defined(_WIN32)
    _mkdir(Options.output_dir.c_str());
#elif defined(__linux__)
    mkdir(Options.output_dir.c_str(), 0777);
#elif defined(__APPLE__)
    mkdir(Options.output_dir.c_str(),0777);
#elif defined(__unix__)
    mkdir(Options.output_dir.c_str(),S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
#endif
  }
  g_output_directory=Options.main_output_dir;//necessary evil
}

/////////////////////////////////////////////////////////////////
/// \brief Checks if errors have been written to Pluvial_errors.txt, if so, exits gracefully
/// \note called after parsing everything, prior to running analyses
//
void CheckForErrorWarnings(bool quiet, const optStruct &Options)
{
  int      Len;
  char    *s[MAXINPUTITEMS];
  bool     errors_found(false);
  bool     warnings_found(false);

  ifstream WARNINGS;
  WARNINGS.open((Options.main_output_dir+"Pluvial_errors.txt").c_str());
  if (WARNINGS.fail()){WARNINGS.close();return;}

  CParser *p=new CParser(WARNINGS,Options.main_output_dir+"Pluvial_errors.txt",0);

  while (!(p->Tokenize(s,Len)))
  {
    if(Len>0){
      if(!strcmp(s[0],"ERROR"  )){ errors_found  =true; }
      if(!strcmp(s[0],"WARNING")){ warnings_found=true; }
    }
  }
  delete p;
  WARNINGS.close();
  if ((warnings_found) && (!quiet)){
    cout<<"*******************************************************"<<endl<<endl;
    cout<<"WARNING: Warnings have been issued while parsing data. "<<endl;
    cout<<"         See Pluvial_errors.txt for details            "<<endl<<endl;
    cout<<"*******************************************************"<<endl<<endl;
  }

  if (errors_found){
    ExitGracefully("Errors found in input data. See Pluvial_errors.txt for details",BAD_DATA);
  }
}

//////////////////////////////////////////////////////////////////
/// \brief writes all analysis output files
/// \details writes analyses.json (every run with its series), summary.csv (one line per run)
/// and hydrograph.csv (run with largest peak discharge)
///
/// \param &Runner [in] completed analysis runner
/// \param &Options [in] global program options
//
void WriteAnalysisOutput(const CAnalysisRunner &Runner, const optStruct &Options)
{
  WriteAnalysesJSON(FilenamePrepare("analyses.json",Options),Runner);
  WriteSummaryCSV  (FilenamePrepare("summary.csv"  ,Options),Runner);

  int imax=Runner.GetMaxPeakRunIndex();
  if (imax!=DOESNT_EXIST){
    WriteHydrographCSV(FilenamePrepare("hydrograph.csv",Options),Runner.GetRun(imax));
  }
}

//////////////////////////////////////////////////////////////////
/// \brief writes summary of basin, Tc estimates and peak flows to screen
//
void SummarizeToScreen(const basin_params &basin, const CAnalysisRunner &Runner, const optStruct &Options)
{
  if (Options.silent){return;}

  cout<<"==================== Basin Summary ====================="<<endl;
  if (basin.name!=""){
  cout<<"                Basin: "<<basin.name<<endl;
  }
  cout<<"            Area [ha]: "<<FormatDoubleString(basin.area_ha,2)<<endl;
  if (basin.slope_pct!=PLV_BLANK_DATA){
  cout<<"            Slope [%]: "<<FormatDoubleString(basin.slope_pct,3)<<endl;
  }
  if (basin.length_m!=PLV_BLANK_DATA){
  cout<<"  Flow path length [m]: "<<FormatDoubleString(basin.length_m,1)<<endl;
  }
  if (basin.P3_10!=PLV_BLANK_DATA){
  cout<<"           P3,10 [mm]: "<<FormatDoubleString(basin.P3_10,1)<<endl;
  }
  if (basin.C!=PLV_BLANK_DATA){
  cout<<"  Runoff coefficient : "<<FormatDoubleString(basin.C,3)<<endl;
  }
  if (basin.CN!=PLV_BLANK_DATA){
  cout<<"         Curve number: "<<FormatDoubleString(basin.CN,1)<<endl;
  }
  cout<<"---------------- Time of concentration -----------------"<<endl;
  for (int i=0;i<Runner.GetNumTcResults();i++)
  {
    const tc_result &tc=Runner.GetTcResult(i);
    cout<<"  "<<setw(12)<<left<<TcMethodToString(tc.method)<<right<<": "
        <<FormatDoubleString(tc.tc_hr*MIN_PER_HR,1)<<" min"<<endl;
  }
  cout<<"------------------- Peak discharges --------------------"<<endl;
  for (int i=0;i<Runner.GetNumRuns();i++)
  {
    const hydrograph_result &H=Runner.GetRun(i).hydrograph;
    cout<<"  "<<setw(12)<<left<<H.tc_method
        <<setw(10)<<H.storm_code
        <<"Tr="<<setw(6)<<H.return_period
        <<setw(10)<<RunoffMethodToString(Runner.GetRun(i).runoff)<<right
        <<"X="<<FormatDoubleString(H.x_factor,2)
        <<"  Qp="<<FormatDoubleString(H.peak_flow_m3s,3)<<" m3/s"<<endl;
  }
  if (Runner.GetNumSkipped()>0){
    cout<<"  "<<Runner.GetNumSkipped()<<" combination(s) skipped. See Pluvial_errors.txt for details"<<endl;
  }
  int imax=Runner.GetMaxPeakRunIndex();
  if (imax!=DOESNT_EXIST){
    const hydrograph_result &H=Runner.GetRun(imax).hydrograph;
    cout<<"  Maximum peak discharge: "<<FormatDoubleString(H.peak_flow_m3s,3)<<" m3/s ("
        <<H.tc_method<<", "<<H.storm_code<<", Tr="<<H.return_period<<")"<<endl;
  }
  cout<<"========================================================"<<endl;
}
