/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include "DistributionRegistry.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

#ifndef PLUVIAL_DATA_DIR
#define PLUVIAL_DATA_DIR "data"
#endif

//////////////////////////////////////////////////////////////////
string SCSStormTypeToString(const scs_storm_type type)
{
  switch(type)
  {
    case(SCS_TYPE_I):   {return "scs_type_i";}
    case(SCS_TYPE_IA):  {return "scs_type_ia";}
    case(SCS_TYPE_II):  {return "scs_type_ii";}
    case(SCS_TYPE_III): {return "scs_type_iii";}
  }
  return "scs_type_ii";
}
//////////////////////////////////////////////////////////////////
/// \brief converts string to SCS storm type; accepts "II", "TYPE_II" or "SCS_TYPE_II"
//
scs_storm_type StringToSCSStormType(const string s)
{
  string str=StringToUppercase(s);
  SubstringReplace(str,"SCS_","");
  SubstringReplace(str,"TYPE_","");
  if      (str=="I")  {return SCS_TYPE_I;}
  else if (str=="IA") {return SCS_TYPE_IA;}
  else if (str=="II") {return SCS_TYPE_II;}
  else if (str=="III"){return SCS_TYPE_III;}
  ExitGracefully("StringToSCSStormType: unknown SCS storm type "+s,BAD_DATA);
  return SCS_TYPE_II;
}

/*****************************************************************
   Constructor/Destructor
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief reads all reference curves from data directory
/// \param data_dir [in] directory containing scs_distributions.json and huff_curves.json
//
CDistributionRegistry::CDistributionRegistry(const string data_dir)
{
  _data_dir=data_dir;
  string dir=data_dir;
  if ((!dir.empty()) && (dir[dir.size()-1]!='/') && (dir[dir.size()-1]!='\\')){dir+="/";}
  try
  {
    LoadSCSDistributions(dir+"scs_distributions.json");
    LoadHuffCurves      (dir+"huff_curves.json");
  }
  catch (CPluvialException &)
  {
    DeleteAllCurves();
    throw;
  }
}
//////////////////////////////////////////////////////////////////
CDistributionRegistry::~CDistributionRegistry()
{
  DeleteAllCurves();
}
//////////////////////////////////////////////////////////////////
void CDistributionRegistry::DeleteAllCurves()
{
  for (map<string,CLookupTable*>::iterator it=_curves.begin();it!=_curves.end();++it){
    delete it->second;
  }
  _curves.clear();
}
//////////////////////////////////////////////////////////////////
void CDistributionRegistry::AddCurve(const string key, const vector<double> &x, const vector<double> &y)
{
  ExitGracefullyIf(_curves.find(key)!=_curves.end(),"CDistributionRegistry: duplicate curve "+key,BAD_DATA);
  _curves[key]=new CLookupTable(key,x,y);
}

//////////////////////////////////////////////////////////////////
/// \brief reads SCS distributions {type:{time_hr:[],ratio:[]}}
//
void CDistributionRegistry::LoadSCSDistributions(const string filename)
{
  ifstream INPUT(filename.c_str());
  ExitGracefullyIf(INPUT.fail(),"CDistributionRegistry: cannot open SCS distribution file "+filename,FILE_OPEN_ERR);

  try
  {
    json J=json::parse(INPUT);
    for (json::const_iterator it=J.begin();it!=J.end();++it)
    {
      vector<double> t=it.value().at("time_hr").get<vector<double> >();
      vector<double> r=it.value().at("ratio").get<vector<double> >();
      AddCurve(it.key(),t,r);
    }
  }
  catch (const nlohmann::json::exception &e)
  {
    ExitGracefully("CDistributionRegistry: malformed SCS distribution file "+filename+": "+e.what(),BAD_DATA);
  }
  INPUT.close();

  for (int i=SCS_TYPE_I;i<=SCS_TYPE_III;i++){
    string key=SCSStormTypeToString((scs_storm_type)(i));
    ExitGracefullyIf(_curves.find(key)==_curves.end(),"CDistributionRegistry: "+filename+" is missing distribution "+key,BAD_DATA);
  }
}
//////////////////////////////////////////////////////////////////
/// \brief reads Huff curves {huff_qN:{probability_P:{time_pct:[],rain_pct:[]}}}
//
void CDistributionRegistry::LoadHuffCurves(const string filename)
{
  ifstream INPUT(filename.c_str());
  ExitGracefullyIf(INPUT.fail(),"CDistributionRegistry: cannot open Huff curve file "+filename,FILE_OPEN_ERR);

  try
  {
    json J=json::parse(INPUT);
    for (json::const_iterator q=J.begin();q!=J.end();++q)
    {
      string qkey=q.key();              //e.g., huff_q2
      for (json::const_iterator p=q.value().begin();p!=q.value().end();++p)
      {
        string pkey=p.key();            //e.g., probability_50
        string prob=pkey;
        SubstringReplace(prob,"probability_","p");
        vector<double> t=p.value().at("time_pct").get<vector<double> >();
        vector<double> r=p.value().at("rain_pct").get<vector<double> >();
        AddCurve(qkey+"_"+prob,t,r);
      }
    }
  }
  catch (const nlohmann::json::exception &e)
  {
    ExitGracefully("CDistributionRegistry: malformed Huff curve file "+filename+": "+e.what(),BAD_DATA);
  }
  INPUT.close();
}

/*****************************************************************
   Accessors
------------------------------------------------------------------
******************************************************************/
string CDistributionRegistry::GetDataDirectory() const {return _data_dir;}
int    CDistributionRegistry::GetNumCurves    () const {return (int)(_curves.size());}

//////////////////////////////////////////////////////////////////
const CLookupTable *CDistributionRegistry::GetCurve(const string key) const
{
  map<string,CLookupTable*>::const_iterator it=_curves.find(key);
  ExitGracefullyIf(it==_curves.end(),"CDistributionRegistry: no reference curve "+key,BAD_DATA);
  return it->second;
}
//////////////////////////////////////////////////////////////////
/// \brief returns cumulative ratio vs. time [hr] curve for 24-hr SCS storm
//
const CLookupTable *CDistributionRegistry::GetSCSDistribution(const scs_storm_type type) const
{
  return GetCurve(SCSStormTypeToString(type));
}
//////////////////////////////////////////////////////////////////
/// \brief returns cumulative rain [%] vs. time [%] Huff curve
/// \param quartile [in] 1-4
/// \param probability [in] 10, 50 or 90 [%]
//
const CLookupTable *CDistributionRegistry::GetHuffCurve(const int quartile, const int probability) const
{
  ExitGracefullyIf((quartile<1) || (quartile>4),"GetHuffCurve: quartile must be 1, 2, 3 or 4",BAD_DATA);
  ExitGracefullyIf((probability!=10) && (probability!=50) && (probability!=90),
                   "GetHuffCurve: probability must be 10, 50 or 90",BAD_DATA);
  return GetCurve("huff_q"+to_string(quartile)+"_p"+to_string(probability));
}
//////////////////////////////////////////////////////////////////
/// \brief directory of bundled reference data, set at build time
//
string CDistributionRegistry::GetDefaultDataDirectory()
{
  return PLUVIAL_DATA_DIR;
}
