/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include "UnitHydrograph.h"

//SCS dimensionless curvilinear unit hydrograph (NEH-630 Table 16-1)
static const int    SCS_DUH_N=33;
static const double SCS_DUH_T[SCS_DUH_N]={0.0,0.1,0.2,0.3,0.4,0.5,0.6,0.7,0.8,0.9,1.0,1.1,1.2,1.3,1.4,1.5,1.6,1.7,1.8,1.9,
                                          2.0,2.2,2.4,2.6,2.8,3.0,3.2,3.4,3.6,3.8,4.0,4.5,5.0};
static const double SCS_DUH_Q[SCS_DUH_N]={0.000,0.030,0.100,0.190,0.310,0.470,0.660,0.820,0.930,0.990,1.000,0.990,0.930,
                                          0.860,0.780,0.680,0.560,0.460,0.390,0.330,0.280,0.207,0.147,0.107,0.077,0.055,
                                          0.040,0.029,0.021,0.015,0.011,0.005,0.000};

//////////////////////////////////////////////////////////////////
/// \brief default unit hydrograph parameters
//
unit_hydrograph_params::unit_hydrograph_params()
{
  area_km2 =PLV_BLANK_DATA;
  tc_hr    =PLV_BLANK_DATA;
  dt_hr    =PLV_BLANK_DATA;
  X        =1.0;
  prf      =SCS_STANDARD_PRF;
  gamma_m  =3.7;
  length_km=PLV_BLANK_DATA;
  lc_km    =PLV_BLANK_DATA;
  Ct       =2.0;
  Cp       =0.6;
  R_hr     =PLV_BLANK_DATA;
}

/*****************************************************************
   Time parameters
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief SCS lag time, 0.6 Tc [hr]
//
double SCSLagTime(const double &tc_hr)
{
  return 0.6*tc_hr;
}
//////////////////////////////////////////////////////////////////
/// \brief SCS time to peak, dt/2 + lag [hr]
//
double SCSTimeToPeak(const double &tc_hr, const double &dt_hr)
{
  return 0.5*dt_hr+SCSLagTime(tc_hr);
}
//////////////////////////////////////////////////////////////////
/// \brief SCS triangular time base, 2.67 Tp [hr]
//
double SCSTimeBase(const double &tp_hr)
{
  return 2.67*tp_hr;
}
//////////////////////////////////////////////////////////////////
/// \brief recommended computational time step [hr]
/// \details 0.133 Tc, but not less than 15 min for 24-hr SCS storms or min_dt_min otherwise
/// \param tc_hr [in] time of concentration [hr]
/// \param storm_tag [in] storm method tag (may be empty)
/// \param min_dt_min [in] absolute minimum time step [min]
//
double RecommendedDt(const double &tc_hr, const string storm_tag, const double &min_dt_min)
{
  double method_min=min_dt_min;
  string tag=StringToLowercase(storm_tag);
  if ((tag.find("scs")!=string::npos)     || (tag.find("type_i")!=string::npos) ||
      (tag.find("nrcs")!=string::npos)    || (tag.find("24h")!=string::npos))
  {
    method_min=15.0;
  }
  return max(0.133*tc_hr,max(method_min,min_dt_min)/MIN_PER_HR);
}

//////////////////////////////////////////////////////////////////
/// \brief Snyder lag time tp=Ct (L Lc)^0.3, L and Lc in miles [hr]
/// \param length_km [in] main channel length [km]
/// \param lc_km [in] distance along channel from outlet to point nearest the centroid [km]
/// \param Ct [in] lag coefficient (1.8-2.2 typical)
//
double SnyderLagTime(const double &length_km, const double &lc_km, const double &Ct)
{
  ExitGracefullyIf(length_km<=0,"SnyderLagTime: channel length must be positive",BAD_DATA);
  ExitGracefullyIf(lc_km<=0,    "SnyderLagTime: centroid distance must be positive",BAD_DATA);
  ExitGracefullyIf(Ct<=0,       "SnyderLagTime: Ct must be positive",BAD_DATA);
  return Ct*pow(length_km*MILES_PER_KM*lc_km*MILES_PER_KM,0.3);
}
//////////////////////////////////////////////////////////////////
/// \brief Snyder peak flow for one inch of runoff, Qp=640 Cp A/tp (cfs, mi2) [m3/s]
//
double SnyderPeak(const double &area_km2, const double &tp_hr, const double &Cp)
{
  ExitGracefullyIf(area_km2<=0,"SnyderPeak: area must be positive",BAD_DATA);
  ExitGracefullyIf(tp_hr<=0,   "SnyderPeak: lag time must be positive",BAD_DATA);
  ExitGracefullyIf(Cp<=0,      "SnyderPeak: Cp must be positive",BAD_DATA);
  return 640.0*Cp*(area_km2*SQMI_PER_KM2)/tp_hr*M3S_PER_CFS;
}
//////////////////////////////////////////////////////////////////
/// \brief Snyder hydrograph widths at 50% and 75% of peak [hr]
/// \param qp_m3s [in] peak flow for one inch of runoff [m3/s]
/// \param area_km2 [in] basin area [km2]
/// \param W50_hr [out] width at 50% of peak
/// \param W75_hr [out] width at 75% of peak
//
void SnyderWidths(const double &qp_m3s, const double &area_km2, double &W50_hr, double &W75_hr)
{
  ExitGracefullyIf((qp_m3s<=0) || (area_km2<=0),"SnyderWidths: peak flow and area must be positive",BAD_DATA);
  double qa=(qp_m3s/M3S_PER_CFS)/(area_km2*SQMI_PER_KM2); //[cfs/mi2]
  W50_hr=770.0*pow(qa,-1.08);
  W75_hr=440.0*pow(qa,-1.08);
}
//////////////////////////////////////////////////////////////////
/// \brief Clark default (diamond) time-area curve, cumulative area fraction
/// \param t_over_tc [in] t/Tc, clamped to [0,1]
//
double ClarkTimeArea(const double &t_over_tc)
{
  double x=max(min(t_over_tc,1.0),0.0);
  double a;
  if (x<=0.5){a=1.414*pow(x,1.5);}
  else       {a=1.0-1.414*pow(1.0-x,1.5);}
  return max(min(a,1.0),0.0);
}

/*****************************************************************
   Ordinate sampling
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief sets ordinate times to k*dt, k=0..ceil(tb/dt)
//
static void SetTimeGrid(unit_hydrograph &UH, const double &tb_hr, const double &dt_hr)
{
  int N=(int)(ceil(tb_hr/dt_hr-1e-9))+1;
  if (N<2){N=2;}
  UH.time_hr .resize(N);
  UH.flow_m3s.assign(N,0.0);
  for (int k=0;k<N;k++){UH.time_hr[k]=k*dt_hr;}
}

//////////////////////////////////////////////////////////////////
/// \brief scales ordinates so that sum(q)*dt equals 1 mm over the basin
/// \details a closing zero ordinate is appended if the last ordinate is not zero;
/// with zero end ordinates the trapezoidal volume of any convolved hydrograph then equals sum(excess)*A exactly
//
static void NormalizeToUnitDepth(unit_hydrograph &UH, const double &area_km2, const double &dt_hr)
{
  UH.flow_m3s[0]=0.0;
  if (UH.flow_m3s.back()>0.0){
    UH.time_hr .push_back(UH.time_hr.back()+dt_hr);
    UH.flow_m3s.push_back(0.0);
  }
  double sum=VectorSum(UH.flow_m3s);
  ExitGracefullyIf(sum<=0.0,"NormalizeToUnitDepth: unit hydrograph has no volume",RUNTIME_ERR);

  double factor=(area_km2*M3_PER_MM_KM2)/(sum*dt_hr*SEC_PER_HR);
  for (int k=0;k<(int)(UH.flow_m3s.size());k++){UH.flow_m3s[k]*=factor;}
}

//////////////////////////////////////////////////////////////////
/// \brief fills triangular ordinates (peak qp at tp, zero at tb) on k*dt grid
//
static void FillTriangle(unit_hydrograph &UH, const double &area_km2, const double &dt_hr)
{
  double tr=UH.tb_hr-UH.tp_hr;
  SetTimeGrid(UH,UH.tb_hr,dt_hr);
  for (int k=0;k<(int)(UH.time_hr.size());k++)
  {
    double t=UH.time_hr[k];
    double q;
    if (t<=UH.tp_hr){q=UH.qp_m3s*t/UH.tp_hr;}
    else            {q=(tr>0) ? UH.qp_m3s*(UH.tb_hr-t)/tr : 0.0;}
    UH.flow_m3s[k]=max(q,0.0);
  }
  NormalizeToUnitDepth(UH,area_km2,dt_hr);
}

/*****************************************************************
   Unit hydrographs
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief triangular unit hydrograph with morphological factor X
/// \details Tp=dt/2+0.6Tc, qp=0.278 A/Tp * 2/(1+X), Tb=(1+X)Tp
/// \param area_ha [in] basin area [ha]
/// \param tc_hr [in] time of concentration [hr]
/// \param dt_hr [in] time step [hr]
/// \param X [in] ratio of recession time to rise time (>=1)
//
unit_hydrograph TriangularUHX(const double &area_ha, const double &tc_hr, const double &dt_hr, const double &X)
{
  ExitGracefullyIf(area_ha<=0,"TriangularUHX: area must be positive",BAD_DATA);
  ExitGracefullyIf(tc_hr<=0,  "TriangularUHX: time of concentration must be positive",BAD_DATA);
  ExitGracefullyIf(dt_hr<=0,  "TriangularUHX: time step must be positive",BAD_DATA);
  ExitGracefullyIf(X<1.0,     "TriangularUHX: X factor must be at least 1.0",BAD_DATA);

  unit_hydrograph UH;
  UH.method  =UH_TRIANGULAR_X;
  UH.x_factor=X;
  UH.tp_hr   =SCSTimeToPeak(tc_hr,dt_hr);
  UH.qp_m3s  =UH_UNIT_CONV*(area_ha/HA_PER_KM2)/UH.tp_hr*2.0/(1.0+X);
  UH.tb_hr   =(1.0+X)*UH.tp_hr;
  FillTriangle(UH,area_ha/HA_PER_KM2,dt_hr);
  return UH;
}

//////////////////////////////////////////////////////////////////
/// \brief SCS triangular unit hydrograph, qp=0.208 A/Tp, Tb=2.67Tp
/// \param area_km2 [in] basin area [km2]
//
unit_hydrograph SCSTriangularUH(const double &area_km2, const double &tc_hr, const double &dt_hr)
{
  ExitGracefullyIf(area_km2<=0,"SCSTriangularUH: area must be positive",BAD_DATA);
  ExitGracefullyIf(tc_hr<=0,   "SCSTriangularUH: time of concentration must be positive",BAD_DATA);
  ExitGracefullyIf(dt_hr<=0,   "SCSTriangularUH: time step must be positive",BAD_DATA);

  unit_hydrograph UH;
  UH.method  =UH_SCS_TRIANGULAR;
  UH.x_factor=SCS_X_FACTOR;
  UH.tp_hr   =SCSTimeToPeak(tc_hr,dt_hr);
  UH.tb_hr   =SCSTimeBase(UH.tp_hr);
  UH.qp_m3s  =SCS_PEAK_COEFF*area_km2/UH.tp_hr;
  FillTriangle(UH,area_km2,dt_hr);
  return UH;
}

//////////////////////////////////////////////////////////////////
/// \brief SCS curvilinear unit hydrograph from the dimensionless table
/// \details qp=(PRF/484) 0.208 A/Tp. For PRF other than 484 the recession limb
/// is stretched in time so that the hydrograph still holds 1 mm.
/// \param prf [in] peak rate factor
//
unit_hydrograph SCSCurvilinearUH(const double &area_km2, const double &tc_hr, const double &dt_hr, const double &prf)
{
  ExitGracefullyIf(area_km2<=0,"SCSCurvilinearUH: area must be positive",BAD_DATA);
  ExitGracefullyIf(tc_hr<=0,   "SCSCurvilinearUH: time of concentration must be positive",BAD_DATA);
  ExitGracefullyIf(dt_hr<=0,   "SCSCurvilinearUH: time step must be positive",BAD_DATA);
  ExitGracefullyIf(prf<=0,     "SCSCurvilinearUH: peak rate factor must be positive",BAD_DATA);

  unit_hydrograph UH;
  UH.method  =UH_SCS_CURVILINEAR;
  UH.x_factor=SCS_X_FACTOR;
  UH.tp_hr   =SCSTimeToPeak(tc_hr,dt_hr);
  UH.qp_m3s  =(prf/SCS_STANDARD_PRF)*SCS_PEAK_COEFF*area_km2/UH.tp_hr;

  //dimensionless areas of rising (t/Tp<=1) and recession limbs
  double rise=0.0,fall=0.0;
  for (int i=0;i<SCS_DUH_N-1;i++){
    double a=0.5*(SCS_DUH_Q[i]+SCS_DUH_Q[i+1])*(SCS_DUH_T[i+1]-SCS_DUH_T[i]);
    if (SCS_DUH_T[i+1]<=1.0){rise+=a;}
    else                    {fall+=a;}
  }
  double needed =(area_km2*M3_PER_MM_KM2)/(UH.qp_m3s*UH.tp_hr*SEC_PER_HR);
  double stretch=(needed-rise)/fall;
  ExitGracefullyIf(stretch<=0,"SCSCurvilinearUH: peak rate factor too large for a 1 mm unit hydrograph",BAD_DATA);

  double tmax=SCS_DUH_T[SCS_DUH_N-1];
  UH.tb_hr=UH.tp_hr*(1.0+stretch*(tmax-1.0));
  SetTimeGrid(UH,UH.tb_hr,dt_hr);
  for (int k=0;k<(int)(UH.time_hr.size());k++)
  {
    double x=UH.time_hr[k]/UH.tp_hr;
    if (x>1.0){x=1.0+(x-1.0)/stretch;}
    UH.flow_m3s[k]=UH.qp_m3s*InterpolateClamped(x,SCS_DUH_T,SCS_DUH_Q,SCS_DUH_N);
  }
  NormalizeToUnitDepth(UH,area_km2,dt_hr);
  return UH;
}

//////////////////////////////////////////////////////////////////
/// \brief gamma unit hydrograph, q/qp=(t/Tp)^m exp(m(1-t/Tp))
/// \details qp follows from 1 mm of runoff: qp=1000 A/(3600 Tp e^m Gamma(m+1)/m^(m+1)); Tb=5Tp
/// \param m [in] shape parameter (3.7 matches PRF 484)
//
unit_hydrograph GammaUH(const double &area_km2, const double &tc_hr, const double &dt_hr, const double &m)
{
  ExitGracefullyIf(area_km2<=0,"GammaUH: area must be positive",BAD_DATA);
  ExitGracefullyIf(tc_hr<=0,   "GammaUH: time of concentration must be positive",BAD_DATA);
  ExitGracefullyIf(dt_hr<=0,   "GammaUH: time step must be positive",BAD_DATA);
  ExitGracefullyIf(m<=0,       "GammaUH: shape parameter must be positive",BAD_DATA);

  unit_hydrograph UH;
  UH.method  =UH_GAMMA;
  UH.x_factor=SCS_X_FACTOR;
  UH.tp_hr   =SCSTimeToPeak(tc_hr,dt_hr);
  UH.tb_hr   =5.0*UH.tp_hr;

  double shape_area=exp(m)*tgamma(m+1.0)/pow(m,m+1.0); //integral of q/qp over t/Tp
  UH.qp_m3s  =(area_km2*M3_PER_MM_KM2)/(SEC_PER_HR*UH.tp_hr*shape_area);

  SetTimeGrid(UH,UH.tb_hr,dt_hr);
  for (int k=0;k<(int)(UH.time_hr.size());k++)
  {
    double x=UH.time_hr[k]/UH.tp_hr;
    UH.flow_m3s[k]=UH.qp_m3s*pow(x,m)*exp(m*(1.0-x));
  }
  NormalizeToUnitDepth(UH,area_km2,dt_hr);
  return UH;
}

//////////////////////////////////////////////////////////////////
/// \brief Snyder synthetic unit hydrograph
/// \details shape passes through 50% and 75% widths, one third before the peak;
/// Tb=tp+3 W50. Peak is reported per mm of runoff.
/// \param length_km [in] main channel length [km]
/// \param lc_km [in] distance from outlet to centroid [km]
//
unit_hydrograph SnyderUH(const double &area_km2, const double &length_km, const double &lc_km, const double &dt_hr,
                         const double &Ct, const double &Cp)
{
  ExitGracefullyIf(dt_hr<=0,"SnyderUH: time step must be positive",BAD_DATA);

  double tp     =SnyderLagTime(length_km,lc_km,Ct);
  double qp_inch=SnyderPeak(area_km2,tp,Cp);
  double W50,W75;
  SnyderWidths(qp_inch,area_km2,W50,W75);

  unit_hydrograph UH;
  UH.method  =UH_SNYDER;
  UH.tp_hr   =tp;
  UH.tb_hr   =tp+3.0*W50;
  UH.qp_m3s  =qp_inch/MM_PER_INCH;
  UH.x_factor=(UH.tb_hr-tp)/tp;

  //key points; rising points before t=0 are dropped
  double tk[7]={0.0,tp-W50/3.0,tp-W75/3.0,tp,tp+2.0*W75/3.0,tp+2.0*W50/3.0,UH.tb_hr};
  double qk[7]={0.0,0.5,0.75,1.0,0.75,0.5,0.0};
  double tt[7],qq[7];
  int    nk=0;
  for (int i=0;i<7;i++){
    if ((i==0) || (tk[i]>tt[nk-1])){tt[nk]=tk[i];qq[nk]=qk[i];nk++;}
  }

  SetTimeGrid(UH,UH.tb_hr,dt_hr);
  for (int k=0;k<(int)(UH.time_hr.size());k++){
    UH.flow_m3s[k]=UH.qp_m3s*InterpolateClamped(UH.time_hr[k],tt,qq,nk);
  }
  NormalizeToUnitDepth(UH,area_km2,dt_hr);
  return UH;
}

//////////////////////////////////////////////////////////////////
/// \brief Clark unit hydrograph: time-area inflow routed through a linear reservoir
/// \details Tb=Tc+5R. Reported peak is the largest ordinate.
/// \param R_hr [in] storage coefficient [hr]
//
unit_hydrograph ClarkUH(const double &area_km2, const double &tc_hr, const double &R_hr, const double &dt_hr)
{
  ExitGracefullyIf(area_km2<=0,"ClarkUH: area must be positive",BAD_DATA);
  ExitGracefullyIf(tc_hr<=0,   "ClarkUH: time of concentration must be positive",BAD_DATA);
  ExitGracefullyIf(R_hr<=0,    "ClarkUH: storage coefficient must be positive",BAD_DATA);
  ExitGracefullyIf(dt_hr<=0,   "ClarkUH: time step must be positive",BAD_DATA);

  unit_hydrograph UH;
  UH.method  =UH_CLARK;
  UH.tb_hr   =tc_hr+5.0*R_hr;
  SetTimeGrid(UH,UH.tb_hr,dt_hr);

  double c1=dt_hr/(2.0*R_hr+dt_hr);
  double c0=(2.0*R_hr-dt_hr)/(2.0*R_hr+dt_hr);
  int    N=(int)(UH.time_hr.size());

  vector<double> inflow(N,0.0);
  for (int k=1;k<N;k++){
    double dA=ClarkTimeArea(UH.time_hr[k]/tc_hr)-ClarkTimeArea(UH.time_hr[k-1]/tc_hr);
    inflow[k]=dA*area_km2*M3_PER_MM_KM2/(dt_hr*SEC_PER_HR);
  }
  for (int k=1;k<N;k++){
    UH.flow_m3s[k]=c1*(inflow[k]+inflow[k-1])+c0*UH.flow_m3s[k-1];
  }
  NormalizeToUnitDepth(UH,area_km2,dt_hr);

  int ipeak  =VectorArgMax(UH.flow_m3s);
  UH.qp_m3s  =UH.flow_m3s[ipeak];
  UH.tp_hr   =UH.time_hr[ipeak];
  UH.x_factor=(UH.tb_hr-UH.tp_hr)/UH.tp_hr;
  return UH;
}

//////////////////////////////////////////////////////////////////
/// \brief generates unit hydrograph by method
/// \details Snyder uses length_km and lc_km instead of Tc; Clark defaults to R=2Tc
//
unit_hydrograph GenerateUnitHydrograph(const uh_method method, const unit_hydrograph_params &P)
{
  string missing="";
  if (P.area_km2==PLV_BLANK_DATA)                         {missing+=" area_km2";}
  if (P.dt_hr   ==PLV_BLANK_DATA)                         {missing+=" dt_hr";}
  if ((P.tc_hr  ==PLV_BLANK_DATA) && (method!=UH_SNYDER)) {missing+=" tc_hr";}
  if (method==UH_SNYDER){
    if (P.length_km==PLV_BLANK_DATA){missing+=" length_km";}
    if (P.lc_km    ==PLV_BLANK_DATA){missing+=" lc_km";}
  }
  ExitGracefullyIf(missing!="","GenerateUnitHydrograph: "+UHMethodToString(method)+" unit hydrograph missing parameters:"+missing,BAD_DATA);

  switch(method)
  {
  case(UH_TRIANGULAR_X):    {return TriangularUHX   (P.area_km2*HA_PER_KM2,P.tc_hr,P.dt_hr,P.X);}
  case(UH_SCS_TRIANGULAR):  {return SCSTriangularUH (P.area_km2,P.tc_hr,P.dt_hr);}
  case(UH_SCS_CURVILINEAR): {return SCSCurvilinearUH(P.area_km2,P.tc_hr,P.dt_hr,P.prf);}
  case(UH_GAMMA):           {return GammaUH         (P.area_km2,P.tc_hr,P.dt_hr,P.gamma_m);}
  case(UH_SNYDER):          {return SnyderUH        (P.area_km2,P.length_km,P.lc_km,P.dt_hr,P.Ct,P.Cp);}
  case(UH_CLARK):
  {
    double R=(P.R_hr==PLV_BLANK_DATA) ? 2.0*P.tc_hr : P.R_hr;
    return ClarkUH(P.area_km2,P.tc_hr,R,P.dt_hr);
  }
  }
  ExitGracefully("GenerateUnitHydrograph: unknown unit hydrograph method",BAD_DATA);
  return unit_hydrograph();
}

//////////////////////////////////////////////////////////////////
/// \brief converts string to unit hydrograph method
//
uh_method StringToUHMethod(const string s)
{
  string t=StringToLowercase(s);
  if      ((t=="triangular_x") || (t=="triangular") || (t=="x")){return UH_TRIANGULAR_X;}
  else if ((t=="scs_triangular") || (t=="scs"))                 {return UH_SCS_TRIANGULAR;}
  else if (t=="scs_curvilinear")                                {return UH_SCS_CURVILINEAR;}
  else if (t=="gamma")                                          {return UH_GAMMA;}
  else if (t=="snyder")                                         {return UH_SNYDER;}
  else if (t=="clark")                                          {return UH_CLARK;}
  ExitGracefully("StringToUHMethod: unrecognized unit hydrograph method "+s,BAD_DATA);
  return UH_SCS_TRIANGULAR;
}
//////////////////////////////////////////////////////////////////
/// \brief converts unit hydrograph method to tag
//
string UHMethodToString(const uh_method method)
{
  switch(method)
  {
  case(UH_TRIANGULAR_X):    {return "triangular_x";}
  case(UH_SCS_TRIANGULAR):  {return "scs_triangular";}
  case(UH_SCS_CURVILINEAR): {return "scs_curvilinear";}
  case(UH_GAMMA):           {return "gamma";}
  case(UH_SNYDER):          {return "snyder";}
  case(UH_CLARK):           {return "clark";}
  }
  return "unknown";
}

/*****************************************************************
   Convolution
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief full discrete convolution Q[k]=sum P[m] U[k-m]
/// \return array of size excess+uh-1 (empty if either is empty)
//
vector<double> ConvolveUH(const vector<double> &excess_mm, const vector<double> &uh_m3s)
{
  vector<double> Q;
  int nP=(int)(excess_mm.size());
  int nU=(int)(uh_m3s.size());
  if ((nP==0) || (nU==0)){return Q;}

  Q.resize(nP+nU-1,0.0);
  for (int m=0;m<nP;m++){
    for (int j=0;j<nU;j++){
      Q[m+j]+=excess_mm[m]*uh_m3s[j];
    }
  }
  return Q;
}

//////////////////////////////////////////////////////////////////
/// \brief direct runoff hydrograph by convolution of excess with unit hydrograph
/// \param dt_hr [in] time step of excess series [hr]; must match unit hydrograph spacing
//
hydrograph_result GenerateHydrograph(const vector<double> &excess_mm, const unit_hydrograph &UH, const double &dt_hr)
{
  ExitGracefullyIf(excess_mm.empty(),"GenerateHydrograph: empty rainfall excess series",BAD_DATA);
  ExitGracefullyIf((UH.time_hr.size()>1) && (fabs(UH.time_hr[1]-dt_hr)>1e-9*dt_hr),
                   "GenerateHydrograph: unit hydrograph ordinate spacing differs from excess time step",BAD_DATA);

  hydrograph_result HG;
  HG.flow_m3s=ConvolveUH(excess_mm,UH.flow_m3s);
  int N=(int)(HG.flow_m3s.size());
  HG.time_hr.resize(N);
  vector<double> tsec(N);
  for (int k=0;k<N;k++){
    HG.time_hr[k]=k*dt_hr;
    tsec[k]=HG.time_hr[k]*SEC_PER_HR;
  }
  int ipeak=VectorArgMax(HG.flow_m3s);
  HG.peak_flow_m3s  =HG.flow_m3s[ipeak];
  HG.time_to_peak_hr=HG.time_hr[ipeak];
  HG.volume_m3      =TrapezoidIntegral(HG.flow_m3s,tsec);

  HG.tp_unit_hr     =UH.tp_hr;
  HG.tb_hr          =UH.tb_hr;
  HG.x_factor       =UH.x_factor;
  HG.uh_tag         =UHMethodToString(UH.method);
  HG.runoff_mm      =VectorSum(excess_mm);
  HG.total_depth_mm =PLV_BLANK_DATA;
  HG.tc_method      ="";
  HG.tc_min         =PLV_BLANK_DATA;
  HG.storm_code     ="";
  HG.return_period  =PLV_BLANK_DATA;
  return HG;
}
