/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  TimeOfConcentration.cpp
  ----------------------------------------------------------------*/
#include "TimeOfConcentration.h"

//////////////////////////////////////////////////////////////////
/// \brief default (blank) time of concentration parameters
//
tc_params::tc_params()
{
  length_m       =PLV_BLANK_DATA;
  length_km      =PLV_BLANK_DATA;
  slope          =PLV_BLANK_DATA;
  slope_pct      =PLV_BLANK_DATA;
  elev_drop_m    =PLV_BLANK_DATA;
  kirpich_surface="natural";
  has_segments   =false;
  P2_mm          =DEFAULT_NRCS_P2;
  C              =PLV_BLANK_DATA;
  mannings_n     =PLV_BLANK_DATA;
  intensity_mmhr =PLV_BLANK_DATA;
  area_ha        =PLV_BLANK_DATA;
  t0_min         =PLV_BLANK_DATA;
  max_iter       =KINEMATIC_MAX_ITER;
  tol_hr         =KINEMATIC_TOL;
  pIDF           =NULL;
  Tr             =PLV_BLANK_DATA;
}

/*****************************************************************
   Empirical formulae
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief Kirpich (1940) time of concentration
/// \details tc = 0.0195 L^0.77 S^-0.385 [min], scaled by surface adjustment factor
/// \param length_m [in] main channel length [m]
/// \param slope [in] mean channel slope [m/m]
/// \param surface [in] natural (1.0), grassy (2.0), concrete (0.4) or concrete_channel (0.2)
/// \return time of concentration [hr]
//
double TcKirpich(const double &length_m, const double &slope, const string surface)
{
  ExitGracefullyIf(length_m<=0,"TcKirpich: length must be positive",BAD_DATA);
  ExitGracefullyIf(slope<=0,   "TcKirpich: slope must be positive",BAD_DATA);

  double factor=1.0;
  string str=StringToUppercase(surface);
  if      (str=="NATURAL")         {factor=1.0;}
  else if (str=="GRASSY")          {factor=2.0;}
  else if (str=="CONCRETE")        {factor=0.4;}
  else if (str=="CONCRETE_CHANNEL"){factor=0.2;}

  double tc_min=0.0195*pow(length_m,0.77)*pow(slope,-0.385);
  return factor*tc_min/MIN_PER_HR;
}
//////////////////////////////////////////////////////////////////
/// \brief Temez time of concentration, tc = 0.3 (L/S^0.25)^0.76 [hr]
/// \param length_km [in] main channel length [km]
/// \param slope [in] mean channel slope [m/m]
//
double TcTemez(const double &length_km, const double &slope)
{
  ExitGracefullyIf(length_km<=0,"TcTemez: length must be positive",BAD_DATA);
  ExitGracefullyIf(slope<=0,    "TcTemez: slope must be positive",BAD_DATA);
  return 0.3*pow(length_km/pow(slope,0.25),0.76);
}
//////////////////////////////////////////////////////////////////
/// \brief California Culverts Practice, tc = 60 (11.9 L^3/H)^0.385 [min], L in mi, H in ft
/// \param length_km [in] main channel length [km]
/// \param elev_drop_m [in] elevation difference along channel [m]
//
double TcCalifornia(const double &length_km, const double &elev_drop_m)
{
  ExitGracefullyIf(length_km<=0,  "TcCalifornia: length must be positive",BAD_DATA);
  ExitGracefullyIf(elev_drop_m<=0,"TcCalifornia: elevation difference must be positive",BAD_DATA);

  double L_mi=length_km*MILES_PER_KM;
  double H_ft=elev_drop_m*FEET_PER_METER;
  double tc_min=60.0*pow(11.9*pow(L_mi,3)/H_ft,0.385);
  return tc_min/MIN_PER_HR;
}
//////////////////////////////////////////////////////////////////
/// \brief FAA formula, tc = 1.8 (1.1-C) L^0.5 / S^0.333 [min], L in ft, S in %
//
double TcFAA(const double &length_m, const double &slope_pct, const double &C)
{
  ExitGracefullyIf(length_m<=0,        "TcFAA: length must be positive",BAD_DATA);
  ExitGracefullyIf(slope_pct<=0,       "TcFAA: slope must be positive",BAD_DATA);
  ExitGracefullyIf((C<=0) || (C>1.0),  "TcFAA: runoff coefficient must be in (0,1]",BAD_DATA);

  double L_ft=length_m*FEET_PER_METER;
  double tc_min=1.8*(1.1-C)*pow(L_ft,0.5)/pow(slope_pct,0.333);
  return tc_min/MIN_PER_HR;
}
//////////////////////////////////////////////////////////////////
/// \brief Desbordes formula for urban basins, tc = t0 + 6.625 A^0.3 S^-0.39 C^-0.45 [min]
/// \param area_ha [in] basin area [ha]
/// \param slope_pct [in] mean basin slope [%]
/// \param C [in] runoff coefficient [-]
/// \param t0_min [in] inlet time [min]
//
double TcDesbordes(const double &area_ha, const double &slope_pct, const double &C, const double &t0_min)
{
  ExitGracefullyIf(area_ha<=0,         "TcDesbordes: area must be positive",BAD_DATA);
  ExitGracefullyIf(slope_pct<=0,       "TcDesbordes: slope must be positive",BAD_DATA);
  ExitGracefullyIf((C<=0) || (C>1.0),  "TcDesbordes: runoff coefficient must be in (0,1]",BAD_DATA);
  ExitGracefullyIf(t0_min<0,           "TcDesbordes: inlet time must be non-negative",BAD_DATA);

  double tc_min=t0_min+6.625*pow(area_ha,0.3)*pow(slope_pct,-0.39)*pow(C,-0.45);
  return tc_min/MIN_PER_HR;
}
//////////////////////////////////////////////////////////////////
/// \brief kinematic wave time of concentration, tc = 6.99 (nL)^0.6/(i^0.4 S^0.3) [min]
/// \details iterates until successive estimates differ by less than tol_hr.
/// If an IDF curve is supplied, intensity is updated to the IDF intensity at duration tc
/// after each iteration. Returns last estimate if not converged.
/// \param pIDF [in] optional IDF curve (may be NULL)
/// \param Tr [in] return period used with pIDF [yr]
//
double TcKinematicWave(const double &length_m, const double &n, const double &slope, const double &intensity_mmhr,
                       const int max_iter, const double &tol_hr,
                       const CIDFCurve *pIDF, const double &Tr)
{
  ExitGracefullyIf(length_m<=0,      "TcKinematicWave: length must be positive",BAD_DATA);
  ExitGracefullyIf(n<=0,             "TcKinematicWave: Manning's n must be positive",BAD_DATA);
  ExitGracefullyIf(slope<=0,         "TcKinematicWave: slope must be positive",BAD_DATA);
  ExitGracefullyIf(intensity_mmhr<=0,"TcKinematicWave: intensity must be positive",BAD_DATA);
  ExitGracefullyIf(max_iter<1,       "TcKinematicWave: at least one iteration required",BAD_DATA);
  ExitGracefullyIf((pIDF!=NULL) && (Tr<=0),"TcKinematicWave: return period required for IDF intensity update",BAD_DATA);

  double i=intensity_mmhr;
  double tc_prev=0.0;
  double tc_hr=0.0;
  for (int iter=0;iter<max_iter;iter++)
  {
    tc_hr=6.99*pow(n*length_m,0.6)/(pow(i,0.4)*pow(slope,0.3))/MIN_PER_HR;
    if (fabs(tc_hr-tc_prev)<tol_hr){return tc_hr;}
    tc_prev=tc_hr;
    if (pIDF!=NULL){i=pIDF->GetIntensity(tc_hr*MIN_PER_HR,Tr);}
  }
  return tc_hr;
}

/*****************************************************************
   NRCS (TR-55) velocity method
------------------------------------------------------------------
******************************************************************/
nrcs_segment SheetFlowSegment(const double &length_m, const double &n, const double &slope, const double &P2_mm)
{
  nrcs_segment seg;
  seg.type=SEGMENT_SHEET;
  seg.length_m=length_m; seg.mannings_n=n; seg.slope=slope; seg.P2_mm=P2_mm;
  seg.surface=SURFACE_UNPAVED; seg.hyd_radius_m=PLV_BLANK_DATA;
  return seg;
}
nrcs_segment ShallowFlowSegment(const double &length_m, const double &slope, const shallow_surface surface)
{
  nrcs_segment seg;
  seg.type=SEGMENT_SHALLOW;
  seg.length_m=length_m; seg.slope=slope; seg.surface=surface;
  seg.mannings_n=PLV_BLANK_DATA; seg.P2_mm=PLV_BLANK_DATA; seg.hyd_radius_m=PLV_BLANK_DATA;
  return seg;
}
nrcs_segment ChannelFlowSegment(const double &length_m, const double &n, const double &slope, const double &hyd_radius_m)
{
  nrcs_segment seg;
  seg.type=SEGMENT_CHANNEL;
  seg.length_m=length_m; seg.mannings_n=n; seg.slope=slope; seg.hyd_radius_m=hyd_radius_m;
  seg.surface=SURFACE_UNPAVED; seg.P2_mm=PLV_BLANK_DATA;
  return seg;
}
//////////////////////////////////////////////////////////////////
/// \brief sheet flow travel time, Tt = 0.007 (n L)^0.8 / (P2^0.5 S^0.4) [hr], L in ft, P2 in inches
/// \param length_m [in] flow length [m], at most 100 m
/// \param P2_mm [in] 2-yr, 24-hr rainfall [mm]
//
double NRCSSheetFlowTime(const double &length_m, const double &n, const double &slope, const double &P2_mm)
{
  ExitGracefullyIf((length_m<=0) || (length_m>100),"NRCSSheetFlowTime: sheet flow length must be in (0,100] m",BAD_DATA);
  ExitGracefullyIf(n<=0,    "NRCSSheetFlowTime: Manning's n must be positive",BAD_DATA);
  ExitGracefullyIf(slope<=0,"NRCSSheetFlowTime: slope must be positive",BAD_DATA);
  ExitGracefullyIf(P2_mm<=0,"NRCSSheetFlowTime: P2 must be positive",BAD_DATA);

  double P2_in=P2_mm/MM_PER_INCH;
  double L_ft =length_m*FEET_PER_METER;
  return 0.007*pow(n*L_ft,0.8)/(pow(P2_in,0.5)*pow(slope,0.4));
}
//////////////////////////////////////////////////////////////////
/// \brief shallow concentrated flow travel time, V = k S^0.5 [m/s]
//
double NRCSShallowFlowTime(const double &length_m, const double &slope, const shallow_surface surface)
{
  ExitGracefullyIf(length_m<=0,"NRCSShallowFlowTime: length must be positive",BAD_DATA);
  ExitGracefullyIf(slope<=0,   "NRCSShallowFlowTime: slope must be positive",BAD_DATA);

  double k=4.918;
  switch(surface)
  {
    case(SURFACE_PAVED):       {k=6.196;break;}
    case(SURFACE_UNPAVED):     {k=4.918;break;}
    case(SURFACE_GRASSED):     {k=4.572;break;}
    case(SURFACE_SHORT_GRASS): {k=2.134;break;}
  }
  double V=k*sqrt(slope);
  return length_m/(V*SEC_PER_HR);
}
//////////////////////////////////////////////////////////////////
/// \brief channel flow travel time, V = R^(2/3) S^0.5 / n [m/s]
//
double NRCSChannelFlowTime(const double &length_m, const double &n, const double &slope, const double &hyd_radius_m)
{
  ExitGracefullyIf(length_m<=0,    "NRCSChannelFlowTime: length must be positive",BAD_DATA);
  ExitGracefullyIf(n<=0,           "NRCSChannelFlowTime: Manning's n must be positive",BAD_DATA);
  ExitGracefullyIf(slope<=0,       "NRCSChannelFlowTime: slope must be positive",BAD_DATA);
  ExitGracefullyIf(hyd_radius_m<=0,"NRCSChannelFlowTime: hydraulic radius must be positive",BAD_DATA);

  double V=pow(hyd_radius_m,2.0/3.0)*sqrt(slope)/n;
  return length_m/(V*SEC_PER_HR);
}
//////////////////////////////////////////////////////////////////
/// \brief travel time through one segment [hr]
/// \param P2_default [in] 2-yr rainfall used if segment does not specify its own [mm]
//
double NRCSSegmentTravelTime(const nrcs_segment &seg, const double &P2_default)
{
  switch(seg.type)
  {
    case(SEGMENT_SHEET):
    {
      double P2=P2_default;
      if ((seg.P2_mm!=PLV_BLANK_DATA) && (seg.P2_mm>0)){P2=seg.P2_mm;}
      return NRCSSheetFlowTime(seg.length_m,seg.mannings_n,seg.slope,P2);
    }
    case(SEGMENT_SHALLOW):
    {
      return NRCSShallowFlowTime(seg.length_m,seg.slope,seg.surface);
    }
    case(SEGMENT_CHANNEL):
    {
      return NRCSChannelFlowTime(seg.length_m,seg.mannings_n,seg.slope,seg.hyd_radius_m);
    }
  }
  return 0.0;
}
//////////////////////////////////////////////////////////////////
/// \brief NRCS velocity method; Tc is sum of segment travel times [hr]
/// \param segments [in] ordered flow segments; empty list returns 0
/// \param P2_mm [in] default 2-yr, 24-hr rainfall [mm]
//
double NRCSVelocityMethod(const vector<nrcs_segment> &segments, const double &P2_mm)
{
  double tc=0.0;
  for (int i=0;i<(int)(segments.size());i++){
    tc+=NRCSSegmentTravelTime(segments[i],P2_mm);
  }
  return tc;
}
//////////////////////////////////////////////////////////////////
/// \brief reference Manning's n for sheet flow cover types
//
double GetSheetFlowMannings(const string cover)
{
  string str=StringToUppercase(cover);
  if      (str=="SMOOTH")     {return 0.011;}
  else if (str=="FALLOW")     {return 0.05;}
  else if (str=="SHORT_GRASS"){return 0.15;}
  else if (str=="DENSE_GRASS"){return 0.24;}
  else if (str=="LIGHT_WOODS"){return 0.40;}
  else if (str=="DENSE_WOODS"){return 0.80;}
  ExitGracefully("GetSheetFlowMannings: unknown sheet flow cover "+cover,BAD_DATA);
  return 0.0;
}
//////////////////////////////////////////////////////////////////
/// \brief converts string to shallow flow surface; unrecognized surfaces are unpaved
//
shallow_surface StringToShallowSurface(const string s)
{
  string str=StringToUppercase(s);
  if      (str=="PAVED")      {return SURFACE_PAVED;}
  else if (str=="UNPAVED")    {return SURFACE_UNPAVED;}
  else if (str=="GRASSED")    {return SURFACE_GRASSED;}
  else if (str=="SHORT_GRASS"){return SURFACE_SHORT_GRASS;}
  return SURFACE_UNPAVED;
}

/*****************************************************************
   Dispatcher
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief calculates time of concentration by the specified method
/// \details length_km and length_m, slope_pct and slope are converted as needed.
/// Raises with list of missing parameters if method requirements are unmet
/// \param method [in] estimation method
/// \param P [in] input parameters
/// \return time of concentration with parameters used
//
tc_result CalculateTc(const tc_method method, const tc_params &P)
{
  tc_result R;
  R.method=method;
  R.tc_hr=0.0;

  double L_m  =P.length_m;
  double L_km =P.length_km;
  double S    =P.slope;
  if ((L_m==PLV_BLANK_DATA) && (L_km!=PLV_BLANK_DATA)){L_m=L_km*M_PER_KM;}
  if ((L_km==PLV_BLANK_DATA) && (L_m!=PLV_BLANK_DATA)){L_km=L_m/M_PER_KM;}
  if ((S==PLV_BLANK_DATA) && (P.slope_pct!=PLV_BLANK_DATA)){S=P.slope_pct/100.0;}

  string missing="";
  string name=TcMethodToString(method);
  switch(method)
  {
    case(TC_KIRPICH):
    {
      if (L_m==PLV_BLANK_DATA){missing+=" length_m";}
      if (S  ==PLV_BLANK_DATA){missing+=" slope";}
      break;
    }
    case(TC_NRCS):
    {
      if (!P.has_segments){missing+=" segments";}
      break;
    }
    case(TC_TEMEZ):
    {
      if (L_km==PLV_BLANK_DATA){missing+=" length_km";}
      if (S   ==PLV_BLANK_DATA){missing+=" slope";}
      break;
    }
    case(TC_CALIFORNIA):
    {
      if (L_km         ==PLV_BLANK_DATA){missing+=" length_km";}
      if (P.elev_drop_m==PLV_BLANK_DATA){missing+=" elevation_drop_m";}
      break;
    }
    case(TC_FAA):
    {
      if (L_m        ==PLV_BLANK_DATA){missing+=" length_m";}
      if (P.slope_pct==PLV_BLANK_DATA){missing+=" slope_pct";}
      if (P.C        ==PLV_BLANK_DATA){missing+=" c";}
      break;
    }
    case(TC_KINEMATIC):
    {
      if (L_m             ==PLV_BLANK_DATA){missing+=" length_m";}
      if (P.mannings_n    ==PLV_BLANK_DATA){missing+=" n";}
      if (S               ==PLV_BLANK_DATA){missing+=" slope";}
      if (P.intensity_mmhr==PLV_BLANK_DATA){missing+=" intensity_mmhr";}
      break;
    }
    case(TC_DESBORDES):
    {
      if (P.area_ha  ==PLV_BLANK_DATA){missing+=" area_ha";}
      if (P.slope_pct==PLV_BLANK_DATA){missing+=" slope_pct";}
      if (P.C        ==PLV_BLANK_DATA){missing+=" c";}
      break;
    }
  }
  ExitGracefullyIf(missing!="","CalculateTc: method "+name+" requires missing parameter(s):"+missing,BAD_DATA);

  switch(method)
  {
    case(TC_KIRPICH):
    {
      R.tc_hr=TcKirpich(L_m,S,P.kirpich_surface);
      R.params["length_m"]=L_m;
      R.params["slope"]   =S;
      break;
    }
    case(TC_NRCS):
    {
      R.tc_hr=NRCSVelocityMethod(P.segments,P.P2_mm);
      R.params["n_segments"]=(double)(P.segments.size());
      R.params["p2_mm"]     =P.P2_mm;
      break;
    }
    case(TC_TEMEZ):
    {
      R.tc_hr=TcTemez(L_km,S);
      R.params["length_km"]=L_km;
      R.params["slope"]    =S;
      break;
    }
    case(TC_CALIFORNIA):
    {
      R.tc_hr=TcCalifornia(L_km,P.elev_drop_m);
      R.params["length_km"]       =L_km;
      R.params["elevation_drop_m"]=P.elev_drop_m;
      break;
    }
    case(TC_FAA):
    {
      R.tc_hr=TcFAA(L_m,P.slope_pct,P.C);
      R.params["length_m"] =L_m;
      R.params["slope_pct"]=P.slope_pct;
      R.params["c"]        =P.C;
      break;
    }
    case(TC_KINEMATIC):
    {
      R.tc_hr=TcKinematicWave(L_m,P.mannings_n,S,P.intensity_mmhr,P.max_iter,P.tol_hr,P.pIDF,P.Tr);
      R.params["length_m"]      =L_m;
      R.params["n"]             =P.mannings_n;
      R.params["slope"]         =S;
      R.params["intensity_mmhr"]=P.intensity_mmhr;
      break;
    }
    case(TC_DESBORDES):
    {
      double t0=DEFAULT_INLET_TIME;
      if (P.t0_min!=PLV_BLANK_DATA){t0=P.t0_min;}
      R.tc_hr=TcDesbordes(P.area_ha,P.slope_pct,P.C,t0);
      R.params["area_ha"]  =P.area_ha;
      R.params["slope_pct"]=P.slope_pct;
      R.params["c"]        =P.C;
      R.params["t0_min"]   =t0;
      break;
    }
  }
  return R;
}
//////////////////////////////////////////////////////////////////
/// \brief converts string to time of concentration method
/// \param s [in] method tag, case-insensitive
//
tc_method StringToTcMethod(const string s)
{
  string str=StringToUppercase(s);
  if      (str=="KIRPICH")   {return TC_KIRPICH;}
  else if (str=="NRCS")      {return TC_NRCS;}
  else if (str=="TEMEZ")     {return TC_TEMEZ;}
  else if (str=="CALIFORNIA"){return TC_CALIFORNIA;}
  else if (str=="FAA")       {return TC_FAA;}
  else if (str=="KINEMATIC") {return TC_KINEMATIC;}
  else if (str=="DESBORDES") {return TC_DESBORDES;}
  ExitGracefully("StringToTcMethod: unknown time of concentration method "+s,BAD_DATA);
  return TC_KIRPICH;
}
//////////////////////////////////////////////////////////////////
string TcMethodToString(const tc_method method)
{
  switch(method)
  {
    case(TC_KIRPICH):    {return "kirpich";}
    case(TC_NRCS):       {return "nrcs";}
    case(TC_TEMEZ):      {return "temez";}
    case(TC_CALIFORNIA): {return "california";}
    case(TC_FAA):        {return "faa";}
    case(TC_KINEMATIC):  {return "kinematic";}
    case(TC_DESBORDES):  {return "desbordes";}
  }
  return "unknown";
}
