/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include "StormDesign.h"

//////////////////////////////////////////////////////////////////
/// \brief storm parameter defaults
//
storm_params::storm_params()
{
  bimodal_peak1       =0.25;
  bimodal_peak2       =0.75;
  bimodal_volume_split=0.5;
  bimodal_peak_width  =0.15;
  bimodal_duration_hr =6.0;

  custom_depth_mm     =PLV_BLANK_DATA;
  custom_distribution ="alternating_blocks";
  custom_duration_hr  =6.0;
}

//////////////////////////////////////////////////////////////////
/// \brief converts storm tag (e.g., "gz", "huff_q3") to storm code
/// \param s [in] storm tag (case-insensitive)
//
storm_code StringToStormCode(const string s)
{
  string tag=StringToLowercase(s);
  if      (tag=="gz")               {return STORM_GZ;}
  else if (tag=="blocks")           {return STORM_BLOCKS;}
  else if (tag=="blocks24")         {return STORM_BLOCKS24;}
  else if (tag=="scs_ii")           {return STORM_SCS_II;}
  else if (tag.substr(0,4)=="huff") {GetHuffQuartileFromCode(tag);return STORM_HUFF;}
  else if (tag=="bimodal")          {return STORM_BIMODAL;}
  else if (tag=="custom")           {return STORM_CUSTOM;}

  ExitGracefully("StringToStormCode: unrecognized storm code '"+s+"'. Valid codes are gz, blocks, blocks24, scs_ii, huff_q1..huff_q4, bimodal, custom",BAD_DATA);
  return STORM_BLOCKS;
}

//////////////////////////////////////////////////////////////////
string StormCodeToString(const storm_code code)
{
  switch(code)
  {
    case(STORM_GZ):       {return "gz";}
    case(STORM_BLOCKS):   {return "blocks";}
    case(STORM_BLOCKS24): {return "blocks24";}
    case(STORM_SCS_II):   {return "scs_ii";}
    case(STORM_HUFF):     {return "huff";}
    case(STORM_BIMODAL):  {return "bimodal";}
    case(STORM_CUSTOM):   {return "custom";}
  }
  return "unknown";
}

//////////////////////////////////////////////////////////////////
/// \brief returns Huff quartile from tag "huff_qN", N=1..4 (2 for plain "huff")
//
int GetHuffQuartileFromCode(const string s)
{
  string tag=StringToLowercase(s);
  if (tag=="huff"){return 2;}
  ExitGracefullyIf((tag.size()!=7) || (tag.substr(0,6)!="huff_q") || (tag[6]<'1') || (tag[6]>'4'),
                   "GetHuffQuartileFromCode: bad Huff storm code '"+s+"'. Use huff or huff_q1..huff_q4",BAD_DATA);
  return tag[6]-'0';
}

//////////////////////////////////////////////////////////////////
/// \brief determines storm duration and time step for a storm code
/// \param storm_tag [in] storm code tag
/// \param tc_hr [in] time of concentration [hr]
/// \param dt_min [in] requested time step [min]
/// \param SP [in] storm parameters
/// \param duration_hr [out] storm duration [hr]
/// \param dt_used [out] time step [min]
//
void GetStormDurationAndDt(const string storm_tag, const double &tc_hr, const double &dt_min,
                           const storm_params &SP, double &duration_hr, double &dt_used)
{
  dt_used=dt_min;
  switch(StringToStormCode(storm_tag))
  {
    case(STORM_GZ):      {duration_hr=6.0;                   break;}
    case(STORM_BIMODAL): {duration_hr=SP.bimodal_duration_hr;break;}
    case(STORM_CUSTOM):  {duration_hr=SP.custom_duration_hr; break;}
    case(STORM_BLOCKS24):
    case(STORM_SCS_II):
    {
      duration_hr=24.0;
      dt_used=max(dt_min,10.0);
      break;
    }
    case(STORM_HUFF):    {duration_hr=max(2.0*tc_hr,2.0);   break;}
    case(STORM_BLOCKS):  {duration_hr=max(tc_hr,1.0);       break;}
  }
}

//////////////////////////////////////////////////////////////////
/// \brief generates the hyetograph for a storm code
/// \param storm_tag [in] storm code tag
/// \param P3_10 [in] DINAGUA reference depth [mm]
/// \param Tr [in] return period [yr]
/// \param duration_hr [in] storm duration [hr] (from GetStormDurationAndDt)
/// \param dt_min [in] time step [min]
//
hyetograph_result GenerateDesignStorm(const string storm_tag, const double &P3_10, const double &Tr,
                                      const double &duration_hr, const double &dt_min,
                                      const storm_params &SP, const CDistributionRegistry &Registry)
{
  switch(StringToStormCode(storm_tag))
  {
    case(STORM_GZ):
    {
      return AlternatingBlocksDinagua(P3_10,Tr,duration_hr,dt_min,PLV_BLANK_DATA,1.0/6.0);
    }
    case(STORM_BIMODAL):
    {
      return BimodalDinagua(P3_10,Tr,duration_hr,dt_min,PLV_BLANK_DATA,
                            SP.bimodal_peak1,SP.bimodal_peak2,SP.bimodal_volume_split,SP.bimodal_peak_width);
    }
    case(STORM_CUSTOM):
    {
      if (!SP.custom_time_min.empty() && !SP.custom_depth_series.empty()){
        return CustomHyetograph(SP.custom_time_min,SP.custom_depth_series);
      }
      else if ((SP.custom_depth_mm!=PLV_BLANK_DATA) && (SP.custom_depth_mm>0))
      {
        string dist=StringToLowercase(SP.custom_distribution);
        double peak=0.5;
        if (dist=="alternating_blocks_gz"){dist="alternating_blocks";peak=1.0/6.0;}
        return CustomDepthStorm(SP.custom_depth_mm,duration_hr,dt_min,dist,Registry,peak);
      }
      return AlternatingBlocksDinagua(P3_10,Tr,duration_hr,dt_min);
    }
    case(STORM_HUFF):
    {
      double total=DinaguaDepth(P3_10,Tr,duration_hr);
      return HuffDistribution(total,duration_hr,dt_min,GetHuffQuartileFromCode(storm_tag),50,Registry);
    }
    case(STORM_SCS_II):
    {
      double total=DinaguaDepth(P3_10,Tr,duration_hr);
      return SCSDistribution(total,duration_hr,dt_min,SCS_TYPE_II,Registry);
    }
    case(STORM_BLOCKS):
    case(STORM_BLOCKS24):
    {
      return AlternatingBlocksDinagua(P3_10,Tr,duration_hr,dt_min);
    }
  }
  return AlternatingBlocksDinagua(P3_10,Tr,duration_hr,dt_min);
}
