/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include "AnalysisRun.h"

/*****************************************************************
   Parameter structures
------------------------------------------------------------------
******************************************************************/
basin_params::basin_params()
{
  name            ="basin";
  area_ha         =PLV_BLANK_DATA;
  slope_pct       =PLV_BLANK_DATA;
  length_m        =PLV_BLANK_DATA;
  elevation_drop_m=PLV_BLANK_DATA;
  P3_10           =PLV_BLANK_DATA;
  C               =PLV_BLANK_DATA;
  CN              =PLV_BLANK_DATA;
  soil_group      ="B";
  c_table         =TABLE_CHOW;
}
//////////////////////////////////////////////////////////////////
analysis_options::analysis_options()
{
  tc_methods.push_back("kirpich");
  tc_methods.push_back("desbordes");
  storm_codes.push_back("gz");
  return_periods.push_back(2);
  return_periods.push_back(10);
  return_periods.push_back(25);
  x_factors.push_back(1.0);
  dt_min=5.0;
  uh_tag="";
  amc   =AMC_II;
  lambda=DEFAULT_LAMBDA;
}

/*****************************************************************
   Constructor/Destructor
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief Implementation of the analysis runner constructor
/// \param basin [in] watershed descriptors
/// \param options [in] method selection and settings
/// \param Registry [in] reference distributions; must outlive runner
//
CAnalysisRunner::CAnalysisRunner(const basin_params &basin, const analysis_options &options, const CDistributionRegistry &Registry)
{
  ExitGracefullyIf((basin.area_ha==PLV_BLANK_DATA) || (basin.area_ha<=0),"CAnalysisRunner: basin area must be positive",BAD_DATA);
  ExitGracefullyIf(options.dt_min<=0,"CAnalysisRunner: time step must be positive",BAD_DATA);
  ExitGracefullyIf(options.return_periods.empty(),"CAnalysisRunner: no return periods specified",BAD_DATA);
  ExitGracefullyIf(options.storm_codes.empty(),   "CAnalysisRunner: no storm codes specified",BAD_DATA);
  for (int i=0;i<(int)(options.storm_codes.size());i++){
    StringToStormCode(options.storm_codes[i]); //validates tags
  }
  if (options.uh_tag!=""){StringToUHMethod(options.uh_tag);}
  _basin    =basin;
  _options  =options;
  _pRegistry=&Registry;
  _nSkipped =0;
  if (_options.x_factors.empty()){_options.x_factors.push_back(1.0);}
}
//////////////////////////////////////////////////////////////////
CAnalysisRunner::~CAnalysisRunner(){}

/*****************************************************************
   Accessors
------------------------------------------------------------------
******************************************************************/
int CAnalysisRunner::GetNumTcResults() const {return (int)(_aTcResults.size());}
//////////////////////////////////////////////////////////////////
const tc_result &CAnalysisRunner::GetTcResult(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=(int)(_aTcResults.size())),"CAnalysisRunner::GetTcResult: bad index",RUNTIME_ERR);
  return _aTcResults[i];
}
//////////////////////////////////////////////////////////////////
int CAnalysisRunner::GetNumRuns() const {return (int)(_aRuns.size());}
//////////////////////////////////////////////////////////////////
const analysis_run &CAnalysisRunner::GetRun(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=(int)(_aRuns.size())),"CAnalysisRunner::GetRun: bad index",RUNTIME_ERR);
  return _aRuns[i];
}
//////////////////////////////////////////////////////////////////
int CAnalysisRunner::GetNumSkipped() const {return _nSkipped;}
//////////////////////////////////////////////////////////////////
/// \brief index of run with largest peak flow (DOESNT_EXIST if no runs)
//
int CAnalysisRunner::GetMaxPeakRunIndex() const
{
  int imax=DOESNT_EXIST;
  for (int i=0;i<(int)(_aRuns.size());i++){
    if ((imax==DOESNT_EXIST) || (_aRuns[i].hydrograph.peak_flow_m3s>_aRuns[imax].hydrograph.peak_flow_m3s)){imax=i;}
  }
  return imax;
}

/*****************************************************************
   Analysis
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief Tc inputs from basin descriptors and additional options
//
tc_params CAnalysisRunner::GetTcParams() const
{
  tc_params P=_options.tc;
  if (P.length_m   ==PLV_BLANK_DATA){P.length_m   =_basin.length_m;}
  if (P.slope_pct  ==PLV_BLANK_DATA){P.slope_pct  =_basin.slope_pct;}
  if (P.elev_drop_m==PLV_BLANK_DATA){P.elev_drop_m=_basin.elevation_drop_m;}
  if (P.area_ha    ==PLV_BLANK_DATA){P.area_ha    =_basin.area_ha;}
  if (P.C          ==PLV_BLANK_DATA){P.C          =_basin.C;}
  return P;
}

//////////////////////////////////////////////////////////////////
/// \brief runoff coefficient for return period
/// \details coverage-weighted Chow values are recomputed exactly for Tr;
/// otherwise the base C is scaled by the average frequency factor
//
double CAnalysisRunner::GetCForTr(const double &Tr) const
{
  if (!_basin.c_coverage.empty() && (_basin.c_table==TABLE_CHOW)){
    return RecalculateWeightedCForTr(_basin.c_coverage,Tr,TABLE_CHOW);
  }
  if (_basin.C==PLV_BLANK_DATA){return PLV_BLANK_DATA;}
  return AdjustCForTr(_basin.C,Tr);
}

//////////////////////////////////////////////////////////////////
/// \brief calculates Tc for each requested method; methods lacking inputs are skipped with a warning
//
void CAnalysisRunner::CalculateTcResults()
{
  tc_params P=GetTcParams();
  _aTcResults.clear();
  for (int i=0;i<(int)(_options.tc_methods.size());i++)
  {
    try
    {
      tc_method method=StringToTcMethod(_options.tc_methods[i]);
      _aTcResults.push_back(CalculateTc(method,P));
    }
    catch (CPluvialException &e)
    {
      WriteWarning("CAnalysisRunner: skipping Tc method "+_options.tc_methods[i]+": "+e.what(),false);
    }
  }
}

//////////////////////////////////////////////////////////////////
/// \brief evaluates a single combination
/// \return false if the runoff method is unavailable for this basin
//
bool CAnalysisRunner::RunSingleAnalysis(const tc_result &tc, const string storm_tag, const double &Tr,
                                        const double &X, const runoff_method method)
{
  analysis_run run;
  run.runoff =method;
  run.amc    =_options.amc;
  run.tc     =tc;
  run.C_used =PLV_BLANK_DATA;
  run.CN_used=PLV_BLANK_DATA;

  double C_adj=PLV_BLANK_DATA;
  if (method==RUNOFF_RATIONAL){C_adj=GetCForTr(Tr);}

  //Desbordes depends upon C, recomputed for the adjusted coefficient
  if ((tc.method==TC_DESBORDES) && (C_adj!=PLV_BLANK_DATA))
  {
    double t0=tc.params.count("t0_min") ? tc.params.at("t0_min") : DEFAULT_INLET_TIME;
    run.tc.tc_hr=TcDesbordes(_basin.area_ha,_basin.slope_pct,C_adj,t0);
    run.tc.params["c"]=C_adj;
  }
  double tc_hr=run.tc.tc_hr;

  double duration_hr,dt_min;
  GetStormDurationAndDt(storm_tag,tc_hr,_options.dt_min,_options.storm,duration_hr,dt_min);
  run.duration_hr=duration_hr;
  run.storm=GenerateDesignStorm(storm_tag,_basin.P3_10,Tr,duration_hr,dt_min,_options.storm,*_pRegistry);

  excess_result E=CalculateRainfallExcess(method,run.storm,C_adj,_basin.CN,_options.amc,_options.lambda);
  if (!E.available){return false;}
  run.C_used =E.C_used;
  run.CN_used=E.CN_used;

  double dt_hr=run.storm.dt_min/MIN_PER_HR;
  storm_code code=StringToStormCode(storm_tag);
  unit_hydrograph UH;
  if ((method==RUNOFF_RATIONAL) || (code==STORM_GZ)){
    UH=TriangularUHX(_basin.area_ha,tc_hr,dt_hr,(code==STORM_GZ) ? X : 1.0);
  }
  else
  {
    unit_hydrograph_params P=_options.uh;
    P.area_km2=_basin.area_ha/HA_PER_KM2;
    P.tc_hr   =tc_hr;
    P.dt_hr   =dt_hr;
    P.X       =1.0;
    if ((P.length_km==PLV_BLANK_DATA) && (_basin.length_m!=PLV_BLANK_DATA)){P.length_km=_basin.length_m/M_PER_KM;}
    uh_method uhm=(_options.uh_tag=="") ? UH_SCS_TRIANGULAR : StringToUHMethod(_options.uh_tag);
    UH=GenerateUnitHydrograph(uhm,P);
  }

  run.hydrograph=GenerateHydrograph(E.excess_mm,UH,dt_hr);
  run.hydrograph.runoff_mm     =E.runoff_mm;
  run.hydrograph.total_depth_mm=run.storm.total_depth_mm;
  run.hydrograph.tc_method     =TcMethodToString(run.tc.method);
  run.hydrograph.tc_min        =tc_hr*MIN_PER_HR;
  run.hydrograph.storm_code    =StringToLowercase(storm_tag);
  run.hydrograph.return_period =Tr;

  _aRuns.push_back(run);
  return true;
}

//////////////////////////////////////////////////////////////////
/// \brief runs every combination of Tc method, storm, return period, runoff method and X factor
/// \details combinations that raise are recorded as warnings and skipped
//
void CAnalysisRunner::Run()
{
  _aRuns.clear();
  _nSkipped=0;
  CalculateTcResults();

  vector<runoff_method> methods;
  if (_options.runoff_methods.empty())
  {
    if ((_basin.C!=PLV_BLANK_DATA) || !_basin.c_coverage.empty()){methods.push_back(RUNOFF_RATIONAL);}
    if (_basin.CN!=PLV_BLANK_DATA)                               {methods.push_back(RUNOFF_SCS_CN);}
  }
  else
  {
    for (int i=0;i<(int)(_options.runoff_methods.size());i++){
      methods.push_back(StringToRunoffMethod(_options.runoff_methods[i]));
    }
  }
  if (methods.empty()){
    WriteWarning("CAnalysisRunner::Run: neither runoff coefficient nor curve number specified; no analyses run",false);
  }

  for (int t=0;t<(int)(_aTcResults.size());t++)
  {
    for (int s=0;s<(int)(_options.storm_codes.size());s++)
    {
      string storm_tag=_options.storm_codes[s];
      int nX=(StringToStormCode(storm_tag)==STORM_GZ) ? (int)(_options.x_factors.size()) : 1;

      for (int r=0;r<(int)(_options.return_periods.size());r++)
      {
        double Tr=_options.return_periods[r];
        for (int m=0;m<(int)(methods.size());m++)
        {
          for (int x=0;x<nX;x++)
          {
            double X=(StringToStormCode(storm_tag)==STORM_GZ) ? _options.x_factors[x] : 1.0;
            string desc=TcMethodToString(_aTcResults[t].method)+" + "+storm_tag+" Tr"+FormatDoubleString(Tr,0)+
                        " "+RunoffMethodToString(methods[m]);
            try
            {
              if (!RunSingleAnalysis(_aTcResults[t],storm_tag,Tr,X,methods[m])){
                WriteAdvisory("CAnalysisRunner::Run: skipping "+desc+" (runoff coefficient unavailable)",false);
                _nSkipped++;
              }
            }
            catch (CPluvialException &e)
            {
              WriteWarning("CAnalysisRunner::Run: skipping "+desc+": "+e.what(),false);
              _nSkipped++;
            }
          }
        }
      }
    }
  }
}

/*****************************************************************
   Output
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief flat JSON representation of analysis run
/// \details blank values are written as null; Tc parameters are prefixed with "tc_"
//
nlohmann::json AnalysisRunToJSON(const analysis_run &run)
{
  nlohmann::json J;
  const hydrograph_result &HG=run.hydrograph;

  J["tc_method"]          =TcMethodToString(run.tc.method);
  J["tc_hr"]              =run.tc.tc_hr;
  J["tc_min"]             =run.tc.tc_hr*MIN_PER_HR;
  for (map<string,double>::const_iterator it=run.tc.params.begin();it!=run.tc.params.end();++it){
    J["tc_"+it->first]=it->second;
  }
  J["storm_code"]         =HG.storm_code;
  J["storm_method"]       =run.storm.method;
  J["return_period"]      =HG.return_period;
  J["duration_hr"]        =run.duration_hr;
  J["dt_min"]             =run.storm.dt_min;
  J["total_depth_mm"]     =run.storm.total_depth_mm;
  J["peak_intensity_mmhr"]=run.storm.peak_intensity_mmhr;
  J["runoff_method"]      =RunoffMethodToString(run.runoff);
  if (run.C_used !=PLV_BLANK_DATA){J["c"] =run.C_used; } else {J["c"] =nlohmann::json();}
  if (run.CN_used!=PLV_BLANK_DATA){J["cn"]=run.CN_used;} else {J["cn"]=nlohmann::json();}
  J["amc"]                =AMCToString(run.amc);
  J["x_factor"]           =HG.x_factor;
  J["uh_method"]          =HG.uh_tag;
  J["peak_flow_m3s"]      =HG.peak_flow_m3s;
  J["time_to_peak_hr"]    =HG.time_to_peak_hr;
  J["tp_unit_hr"]         =HG.tp_unit_hr;
  J["tb_hr"]              =HG.tb_hr;
  J["volume_m3"]          =HG.volume_m3;
  J["runoff_mm"]          =HG.runoff_mm;
  J["storm_time_min"]     =run.storm.time_min;
  J["storm_intensity_mmhr"]=run.storm.intensity_mmhr;
  J["time_hr"]            =HG.time_hr;
  J["flow_m3s"]           =HG.flow_m3s;
  return J;
}

//////////////////////////////////////////////////////////////////
/// \brief writes all analysis runs as JSON array
//
void WriteAnalysesJSON(const string filename, const CAnalysisRunner &Runner)
{
  ofstream OUT;
  OUT.open(filename.c_str());
  if (OUT.fail()){
    ExitGracefully("WriteAnalysesJSON: unable to open output file "+filename+" for writing.",FILE_OPEN_ERR);
  }
  nlohmann::json J=nlohmann::json::array();
  for (int i=0;i<Runner.GetNumRuns();i++){
    J.push_back(AnalysisRunToJSON(Runner.GetRun(i)));
  }
  OUT<<J.dump(2)<<endl;
  OUT.close();
}

//////////////////////////////////////////////////////////////////
static string CSVValue(const double &v, const int precision)
{
  if (v==PLV_BLANK_DATA){return "";}
  return FormatDoubleString(v,precision);
}

//////////////////////////////////////////////////////////////////
/// \brief writes one-row-per-run summary table
//
void WriteSummaryCSV(const string filename, const CAnalysisRunner &Runner)
{
  ofstream OUT;
  OUT.open(filename.c_str());
  if (OUT.fail()){
    ExitGracefully("WriteSummaryCSV: unable to open output file "+filename+" for writing.",FILE_OPEN_ERR);
  }
  OUT<<"tc_method,tc_min,storm,Tr,X,runoff_method,C,CN,duration_hr,total_depth_mm,peak_intensity_mmhr,";
  OUT<<"runoff_mm,peak_flow_m3s,time_to_peak_hr,volume_m3"<<endl;
  for (int i=0;i<Runner.GetNumRuns();i++)
  {
    const analysis_run &run=Runner.GetRun(i);
    const hydrograph_result &HG=run.hydrograph;
    OUT<<HG.tc_method<<","<<CSVValue(HG.tc_min,2)<<","<<HG.storm_code<<","<<CSVValue(HG.return_period,0)<<",";
    OUT<<CSVValue(HG.x_factor,2)<<","<<RunoffMethodToString(run.runoff)<<",";
    OUT<<CSVValue(run.C_used,3)<<","<<CSVValue(run.CN_used,1)<<","<<CSVValue(run.duration_hr,2)<<",";
    OUT<<CSVValue(run.storm.total_depth_mm,2)<<","<<CSVValue(run.storm.peak_intensity_mmhr,2)<<",";
    OUT<<CSVValue(HG.runoff_mm,2)<<","<<CSVValue(HG.peak_flow_m3s,4)<<","<<CSVValue(HG.time_to_peak_hr,3)<<",";
    OUT<<CSVValue(HG.volume_m3,1)<<endl;
  }
  OUT.close();
}

//////////////////////////////////////////////////////////////////
/// \brief writes hydrograph time series of a single run
//
void WriteHydrographCSV(const string filename, const analysis_run &run)
{
  ofstream OUT;
  OUT.open(filename.c_str());
  if (OUT.fail()){
    ExitGracefully("WriteHydrographCSV: unable to open output file "+filename+" for writing.",FILE_OPEN_ERR);
  }
  OUT<<"time_hr,flow_m3s"<<endl;
  for (int k=0;k<(int)(run.hydrograph.time_hr.size());k++){
    OUT<<FormatDoubleString(run.hydrograph.time_hr[k],4)<<","<<FormatDoubleString(run.hydrograph.flow_m3s[k],5)<<endl;
  }
  OUT.close();
}
