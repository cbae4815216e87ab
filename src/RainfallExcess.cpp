/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include "RainfallExcess.h"

//////////////////////////////////////////////////////////////////
/// \brief converts runoff method tag to enum
/// \param s [in] "rational" or "scs_cn" (also accepts "racional", "scs-cn", "scs")
//
runoff_method StringToRunoffMethod(const string s)
{
  string str=StringToUppercase(s);
  SubstringReplace(str,"-","_");
  if      ((str=="RATIONAL") || (str=="RACIONAL"))             {return RUNOFF_RATIONAL;}
  else if ((str=="SCS_CN")   || (str=="SCS") || (str=="CN"))   {return RUNOFF_SCS_CN;}
  ExitGracefully("StringToRunoffMethod: unrecognized runoff method '"+s+"'. Valid methods are rational, scs_cn",BAD_DATA);
  return RUNOFF_RATIONAL;
}
//////////////////////////////////////////////////////////////////
string RunoffMethodToString(const runoff_method method)
{
  if (method==RUNOFF_SCS_CN){return "scs_cn";}
  return "rational";
}

/*****************************************************************
   SCS Curve Number method
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief potential maximum retention S=25400/CN-254 [mm]
/// \param CN [in] curve number [30..100]
//
double SCSRetention(const double &CN)
{
  ExitGracefullyIf((CN<30) || (CN>100),"SCSRetention: CN must be between 30 and 100",BAD_DATA);
  return 25400.0/CN-254.0;
}
//////////////////////////////////////////////////////////////////
/// \brief initial abstraction Ia=lambda*S [mm]
//
double SCSInitialAbstraction(const double &S_mm, const double &lambda)
{
  ExitGracefullyIf(lambda<0,"SCSInitialAbstraction: initial abstraction ratio cannot be negative",BAD_DATA);
  return lambda*S_mm;
}
//////////////////////////////////////////////////////////////////
/// \brief SCS-CN runoff depth Q=(P-Ia)^2/(P-Ia+S) [mm]
/// \param P_mm [in] cumulative rainfall [mm]
/// \param CN [in] curve number
/// \param lambda [in] initial abstraction ratio
//
double SCSRunoff(const double &P_mm, const double &CN, const double &lambda)
{
  double S =SCSRetention(CN);
  double Ia=SCSInitialAbstraction(S,lambda);
  if (P_mm<=Ia){return 0.0;}
  return (P_mm-Ia)*(P_mm-Ia)/(P_mm-Ia+S);
}
//////////////////////////////////////////////////////////////////
/// \brief SCS-CN runoff for a single storm depth, with AMC adjustment
//
scs_runoff_result CalculateSCSRunoff(const double &P_mm, const double &CN, const amc_type amc, const double &lambda)
{
  ExitGracefullyIf(P_mm<0,"CalculateSCSRunoff: negative rainfall depth",BAD_DATA);
  scs_runoff_result R;
  R.rainfall_mm=P_mm;
  R.CN_used    =AdjustCNForAMC(CN,amc);
  R.S_mm       =SCSRetention(R.CN_used);
  R.Ia_mm      =SCSInitialAbstraction(R.S_mm,lambda);
  R.runoff_mm  =SCSRunoff(P_mm,R.CN_used,lambda);
  return R;
}
//////////////////////////////////////////////////////////////////
/// \brief incremental rainfall excess from cumulative rainfall series
/// \param cumulative_mm [in] cumulative rainfall [mm]
/// \return incremental excess; first entry is runoff of first cumulative value
//
vector<double> SCSExcessSeries(const vector<double> &cumulative_mm, const double &CN, const double &lambda)
{
  vector<double> Q(cumulative_mm.size());
  for (int i=0;i<(int)(cumulative_mm.size());i++){
    Q[i]=SCSRunoff(cumulative_mm[i],CN,lambda);
  }
  return Differences(Q);
}

//////////////////////////////////////////////////////////////////
/// \brief minimum (final) infiltration rate fc of a hydrologic soil group [mm/hr]
/// \details used to check that losses in each interval are not below fc
/// \param soil_group [in] "A","B","C" or "D" (case-insensitive)
//
double GetMinimumInfiltrationRate(const string soil_group)
{
  string str=StringToUppercase(soil_group);
  if      (str=="A")                                {return 2.4;}
  else if ((str=="B") || (str=="C") || (str=="D"))  {return 1.2;}
  ExitGracefully("GetMinimumInfiltrationRate: invalid hydrologic soil group '"+soil_group+"'",BAD_DATA);
  return 0.0;
}

/*****************************************************************
   Excess series by method
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
excess_result EmptyExcess(const runoff_method method)
{
  excess_result E;
  E.available=false;
  E.method   =method;
  E.runoff_mm=0.0;
  E.C_used   =PLV_BLANK_DATA;
  E.CN_used  =PLV_BLANK_DATA;
  E.S_mm     =PLV_BLANK_DATA;
  E.Ia_mm    =PLV_BLANK_DATA;
  E.amc      =AMC_II;
  E.lambda   =PLV_BLANK_DATA;
  return E;
}
//////////////////////////////////////////////////////////////////
/// \brief rational method excess, excess[i]=C*depth[i]
/// \param C [in] effective runoff coefficient (PLV_BLANK_DATA if unavailable)
//
excess_result RationalExcess(const hyetograph_result &H, const double &C)
{
  excess_result E=EmptyExcess(RUNOFF_RATIONAL);
  if ((C==PLV_BLANK_DATA) || (C<=0.0)){return E;}
  ExitGracefullyIf(C>1.0,"RationalExcess: runoff coefficient cannot exceed 1",BAD_DATA);

  E.available=true;
  E.C_used   =C;
  E.excess_mm.resize(H.depth_mm.size());
  for (int i=0;i<(int)(H.depth_mm.size());i++){E.excess_mm[i]=C*H.depth_mm[i];}
  E.runoff_mm=VectorSum(E.excess_mm);
  return E;
}
//////////////////////////////////////////////////////////////////
/// \brief SCS-CN excess from hyetograph cumulative depths
/// \param CN [in] AMC II curve number (PLV_BLANK_DATA if unavailable)
//
excess_result SCSExcess(const hyetograph_result &H, const double &CN, const amc_type amc, const double &lambda)
{
  excess_result E=EmptyExcess(RUNOFF_SCS_CN);
  if ((CN==PLV_BLANK_DATA) || (CN<=0.0)){return E;}

  E.available=true;
  E.amc      =amc;
  E.lambda   =lambda;
  E.CN_used  =AdjustCNForAMC(CN,amc);
  E.S_mm     =SCSRetention(E.CN_used);
  E.Ia_mm    =SCSInitialAbstraction(E.S_mm,lambda);
  E.excess_mm=SCSExcessSeries(H.cumulative_mm,E.CN_used,lambda);
  E.runoff_mm=VectorSum(E.excess_mm);
  return E;
}
//////////////////////////////////////////////////////////////////
excess_result CalculateRainfallExcess(const runoff_method method, const hyetograph_result &H,
                                      const double &C, const double &CN, const amc_type amc, const double &lambda)
{
  if (method==RUNOFF_RATIONAL){return RationalExcess(H,C);}
  return SCSExcess(H,CN,amc,lambda);
}

/*****************************************************************
   Rational method peak flow
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief frequency factor Cf applied to C for infrequent storms
//
double RationalFrequencyFactor(const double &Tr)
{
  if      (Tr>=100.0)                                   {return 1.25;}
  else if (fabs(Tr-50.0)<REAL_SMALL)                    {return 1.20;}
  else if (fabs(Tr-25.0)<REAL_SMALL)                    {return 1.10;}
  return 1.0;
}
//////////////////////////////////////////////////////////////////
/// \brief rational method peak flow Q=0.00278*min(Cf*C,1)*i*A [m3/s]
/// \param C [in] runoff coefficient (0,1]
/// \param intensity_mmhr [in] design intensity [mm/hr]
/// \param area_ha [in] basin area [ha]
/// \param Tr [in] return period [yr]
//
double RationalPeakFlow(const double &C, const double &intensity_mmhr, const double &area_ha, const double &Tr)
{
  ExitGracefullyIf((C<=0.0) || (C>1.0),"RationalPeakFlow: runoff coefficient must be between 0 and 1",BAD_DATA);
  ExitGracefullyIf(intensity_mmhr<=0.0,"RationalPeakFlow: intensity must be positive",BAD_DATA);
  ExitGracefullyIf(area_ha<=0.0,       "RationalPeakFlow: area must be positive",BAD_DATA);

  double Ceff=min(RationalFrequencyFactor(Tr)*C,1.0);
  return RATIONAL_UNIT_CONV*Ceff*intensity_mmhr*area_ha;
}
