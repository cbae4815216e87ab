/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include "IDFCurves.h"

/*****************************************************************
   Constructor/Destructor
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief Implementation of the IDF curve constructor
/// \param type [in] IDF family
/// \param aParams [in] array of family coefficients (size nParams)
/// \param nParams [in] number of coefficients supplied
//
CIDFCurve::CIDFCurve(const idf_type type, const double *aParams, const int nParams)
{
  int nRequired=0;
  switch(type)
  {
    case(IDF_SHERMAN):       {nRequired=4;break;}
    case(IDF_BERNARD):       {nRequired=3;break;}
    case(IDF_KOUTSOYIANNIS): {nRequired=4;break;}
    case(IDF_DINAGUA):       {nRequired=1;break;} //area is optional
  }
  ExitGracefullyIf(nParams<nRequired,"CIDFCurve constructor: insufficient coefficients for IDF family",BAD_DATA);
  ExitGracefullyIf(nParams>4,        "CIDFCurve constructor: too many coefficients for IDF family",BAD_DATA);

  _type=type;
  _nParams=nParams;
  for (int i=0;i<4;i++){_aParams[i]=PLV_BLANK_DATA;}
  for (int i=0;i<nParams;i++){_aParams[i]=aParams[i];}

  if (_type==IDF_DINAGUA){
    ExitGracefullyIf(_aParams[0]<=0,"CIDFCurve constructor: P3,10 must be positive",BAD_DATA);
  }
}
//////////////////////////////////////////////////////////////////
CIDFCurve::~CIDFCurve(){}

//////////////////////////////////////////////////////////////////
idf_type CIDFCurve::GetType() const {return _type;}

//////////////////////////////////////////////////////////////////
double CIDFCurve::GetParameter(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=4),"CIDFCurve::GetParameter: bad index",RUNTIME_ERR);
  return _aParams[i];
}

//////////////////////////////////////////////////////////////////
/// \brief returns mean rainfall intensity for storm of given duration
/// \param duration_min [in] storm duration [min]
/// \param Tr [in] return period [yr]
/// \return intensity [mm/hr]
//
double CIDFCurve::GetIntensity(const double &duration_min, const double &Tr) const
{
  ExitGracefullyIf(duration_min<=0,"CIDFCurve::GetIntensity: duration must be positive",BAD_DATA);
  ExitGracefullyIf(Tr<=0,          "CIDFCurve::GetIntensity: return period must be positive",BAD_DATA);

  switch(_type)
  {
    case(IDF_SHERMAN):
    {
      double k=_aParams[0],m=_aParams[1],c=_aParams[2],n=_aParams[3];
      return k*pow(Tr,m)/pow(duration_min+c,n);
    }
    case(IDF_BERNARD):
    {
      double a=_aParams[0],m=_aParams[1],n=_aParams[2];
      double t=max(duration_min,0.1);
      return a*pow(Tr,m)/pow(t,n);
    }
    case(IDF_KOUTSOYIANNIS):
    {
      double mu=_aParams[0],sigma=_aParams[1],theta=_aParams[2],eta=_aParams[3];
      ExitGracefullyIf(Tr<=1.0,"CIDFCurve::GetIntensity: Koutsoyiannis IDF requires return period > 1 yr",BAD_DATA);
      double yT=-log(-log(1.0-1.0/Tr)); //Gumbel reduced variate
      double aT=mu+sigma*yT;
      return aT/pow(duration_min+theta,eta);
    }
    case(IDF_DINAGUA):
    {
      return DinaguaIntensity(_aParams[0],Tr,duration_min/MIN_PER_HR,_aParams[1]);
    }
  }
  return 0.0;
}
//////////////////////////////////////////////////////////////////
/// \brief returns rainfall depth for storm of given duration
/// \param duration_min [in] storm duration [min]
/// \param Tr [in] return period [yr]
/// \return depth [mm]
//
double CIDFCurve::GetDepth(const double &duration_min, const double &Tr) const
{
  return GetIntensity(duration_min,Tr)*duration_min/MIN_PER_HR;
}

//////////////////////////////////////////////////////////////////
/// \brief converts string to IDF family
/// \param s [in] string, case-insensitive
//
idf_type CIDFCurve::StringToIDFType(const string s)
{
  string str=StringToUppercase(s);
  if      (!strcmp(str.c_str(),"SHERMAN"))       {return IDF_SHERMAN;}
  else if (!strcmp(str.c_str(),"BERNARD"))       {return IDF_BERNARD;}
  else if (!strcmp(str.c_str(),"KOUTSOYIANNIS")) {return IDF_KOUTSOYIANNIS;}
  else if (!strcmp(str.c_str(),"DINAGUA"))       {return IDF_DINAGUA;}
  ExitGracefully("CIDFCurve::StringToIDFType: unknown IDF family "+s,BAD_DATA);
  return IDF_SHERMAN;
}

/*****************************************************************
   IDF tables and fitting
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief evaluates intensity and depth for every return period and duration
/// \param durations_min [in] durations [min]
/// \param return_periods [in] return periods [yr]
/// \param curve [in] IDF relation
//
idf_table GenerateIDFTable(const vector<double> &durations_min, const vector<double> &return_periods, const CIDFCurve &curve)
{
  ExitGracefullyIf(durations_min.empty(), "GenerateIDFTable: no durations",BAD_DATA);
  ExitGracefullyIf(return_periods.empty(),"GenerateIDFTable: no return periods",BAD_DATA);

  idf_table T;
  T.durations_min =durations_min;
  T.return_periods=return_periods;
  T.intensity_mmhr.resize(return_periods.size());
  T.depth_mm      .resize(return_periods.size());
  for (int j=0;j<(int)(return_periods.size());j++)
  {
    T.intensity_mmhr[j].resize(durations_min.size());
    T.depth_mm      [j].resize(durations_min.size());
    for (int i=0;i<(int)(durations_min.size());i++)
    {
      T.intensity_mmhr[j][i]=curve.GetIntensity(durations_min[i],return_periods[j]);
      T.depth_mm      [j][i]=T.intensity_mmhr[j][i]*durations_min[i]/MIN_PER_HR;
    }
  }
  return T;
}

//////////////////////////////////////////////////////////////////
/// \brief least squares fit of ln(i)=ln(k)-n ln(t+c) for fixed c
/// \return sum of squared log residuals
//
static double ShermanLogFit(const vector<double> &lt, const vector<double> &t, const double &c, double &k, double &n)
{
  int    N=(int)(t.size());
  double sx=0,sy=0,sxx=0,sxy=0;
  for (int i=0;i<N;i++){
    double x=log(t[i]+c);
    sx+=x; sy+=lt[i]; sxx+=x*x; sxy+=x*lt[i];
  }
  double den=N*sxx-sx*sx;
  if (fabs(den)<REAL_SMALL){k=exp(sy/N);n=0.0;return ALMOST_INF;}
  double slope=(N*sxy-sx*sy)/den;
  double icpt =(sy-slope*sx)/N;
  n=-slope;
  k=exp(icpt);
  double sse=0;
  for (int i=0;i<N;i++){
    double r=lt[i]-(icpt+slope*log(t[i]+c));
    sse+=r*r;
  }
  return sse;
}

//////////////////////////////////////////////////////////////////
/// \brief fits Sherman coefficients to intensities observed for a single return period
/// \details c is searched over [0,60] min, with k and n from a log-linear least squares
/// fit at each c. The return period exponent m is taken as 0.2 and k is rescaled so the
/// curve reproduces the data at Tr.
/// \param durations_min [in] durations [min]
/// \param intensities_mmhr [in] observed intensities [mm/hr]
/// \param Tr [in] return period of the observations [yr]
/// \return Sherman curve {k,m,c,n}
//
CIDFCurve FitShermanCoefficients(const vector<double> &durations_min, const vector<double> &intensities_mmhr, const double &Tr)
{
  const double C_MAX     =60.0;
  const double M_ASSUMED =0.2;
  int N=(int)(durations_min.size());
  ExitGracefullyIf(N!=(int)(intensities_mmhr.size()),"FitShermanCoefficients: durations and intensities differ in size",BAD_DATA);
  ExitGracefullyIf(N<3,  "FitShermanCoefficients: at least three points are needed",BAD_DATA);
  ExitGracefullyIf(Tr<=0,"FitShermanCoefficients: return period must be positive",BAD_DATA);

  vector<double> lt(N);
  for (int i=0;i<N;i++){
    ExitGracefullyIf(durations_min[i]<=0,   "FitShermanCoefficients: durations must be positive",BAD_DATA);
    ExitGracefullyIf(intensities_mmhr[i]<=0,"FitShermanCoefficients: intensities must be positive",BAD_DATA);
    lt[i]=log(intensities_mmhr[i]);
  }

  //coarse search, then refinement about the best c
  double k,n,best_c=0.0,best_sse=ALMOST_INF;
  for (int j=0;j<=120;j++){
    double c=j*0.5;
    double sse=ShermanLogFit(lt,durations_min,c,k,n);
    if (sse<best_sse){best_sse=sse;best_c=c;}
  }
  double c0=best_c;
  for (int j=0;j<=100;j++){
    double c=c0-0.5+j*0.01;
    if ((c<0) || (c>C_MAX)){continue;}
    double sse=ShermanLogFit(lt,durations_min,c,k,n);
    if (sse<best_sse){best_sse=sse;best_c=c;}
  }
  ShermanLogFit(lt,durations_min,best_c,k,n);
  ExitGracefullyIf(n<=0,"FitShermanCoefficients: intensities do not decrease with duration",BAD_DATA);

  double aParams[4]={k/pow(Tr,M_ASSUMED),M_ASSUMED,best_c,n};
  return CIDFCurve(IDF_SHERMAN,aParams,4);
}

/*****************************************************************
   DINAGUA regional formula
------------------------------------------------------------------
   P(d,Tr,A) = P3,10 * Cd(d) * Ct(Tr) * CA(A,d)
   P3,10 is the 3-hour, 10-year depth from the national isohyet map
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief duration factor; Cd(3 hr)=1
/// \param duration_hr [in] storm duration [hr]
//
double DinaguaCd(const double &duration_hr)
{
  ExitGracefullyIf(duration_hr<=0,"DinaguaCd: duration must be positive",BAD_DATA);
  double d=duration_hr;
  if (d<3.0){return 0.6208*d/pow(d+0.0137,0.5639);}
  else      {return 1.0287*d/pow(d+1.0293,0.8083);}
}
//////////////////////////////////////////////////////////////////
/// \brief return period factor; Ct(10 yr)=1
/// \param Tr [in] return period [yr], >=2
//
double DinaguaCt(const double &Tr)
{
  ExitGracefullyIf(Tr<2.0,"DinaguaCt: return period must be at least 2 years",BAD_DATA);
  return 0.5786-0.4312*log10(log(Tr/(Tr-1.0)));
}
//////////////////////////////////////////////////////////////////
/// \brief areal reduction factor
/// \param area_km2 [in] basin area [km2]; no reduction for A<=1 km2 or blank
/// \param duration_hr [in] storm duration [hr]
//
double DinaguaCA(const double &area_km2, const double &duration_hr)
{
  if ((area_km2==PLV_BLANK_DATA) || (area_km2<=1.0)){return 1.0;}
  if (area_km2>300.0){
    WriteWarning("DinaguaCA: basin area of "+FormatDoubleString(area_km2,1)+" km2 exceeds 300 km2; verify against regional studies",false);
  }
  double d=max(duration_hr,0.083); //5 minute minimum
  double CA=1.0-(0.3549*pow(d,-0.4272))*(1.0-exp(-0.005792*area_km2));
  return min(CA,1.0);
}
//////////////////////////////////////////////////////////////////
/// \brief DINAGUA design precipitation
/// \param P3_10 [in] 3-hr, 10-yr reference depth [mm]
/// \param Tr [in] return period [yr]
/// \param duration_hr [in] storm duration [hr]
/// \param area_km2 [in] basin area [km2] or PLV_BLANK_DATA
/// \return depth, intensity and correction factors
//
dinagua_result DinaguaPrecipitation(const double &P3_10, const double &Tr, const double &duration_hr, const double &area_km2)
{
  dinagua_result R;
  ExitGracefullyIf(duration_hr<=0,"DinaguaPrecipitation: duration must be positive",BAD_DATA);
  ExitGracefullyIf(P3_10<=0,      "DinaguaPrecipitation: P3,10 must be positive",BAD_DATA);
  if ((P3_10<50.0) || (P3_10>120.0)){
    WriteWarning("DinaguaPrecipitation: P3,10="+FormatDoubleString(P3_10,1)+" mm is outside typical range for Uruguay (50-120 mm)",false);
  }
  R.Cd=DinaguaCd(duration_hr);
  R.Ct=DinaguaCt(Tr);
  R.CA=DinaguaCA(area_km2,duration_hr);

  R.depth_mm      =P3_10*R.Cd*R.Ct*R.CA;
  R.intensity_mmhr=R.depth_mm/duration_hr;
  return R;
}
//////////////////////////////////////////////////////////////////
double DinaguaDepth(const double &P3_10, const double &Tr, const double &duration_hr, const double &area_km2)
{
  return DinaguaPrecipitation(P3_10,Tr,duration_hr,area_km2).depth_mm;
}
//////////////////////////////////////////////////////////////////
double DinaguaIntensity(const double &P3_10, const double &Tr, const double &duration_hr, const double &area_km2)
{
  return DinaguaPrecipitation(P3_10,Tr,duration_hr,area_km2).intensity_mmhr;
}

//////////////////////////////////////////////////////////////////
/// \brief reference P3,10 for a department of Uruguay
/// \param department [in] department name; case-insensitive, spaces treated as underscores
/// \return P3,10 [mm]
//
double GetDepartmentP3_10(const string department)
{
  const int nDept=19;
  const string aDept [nDept]={"MONTEVIDEO","CANELONES","MALDONADO","ROCHA","COLONIA","SAN_JOSE","FLORIDA",
                              "LAVALLEJA","TREINTA_Y_TRES","CERRO_LARGO","RIVERA","TACUAREMBO","DURAZNO",
                              "FLORES","SORIANO","RIO_NEGRO","PAYSANDU","SALTO","ARTIGAS"};
  const double aP3_10[nDept]={78,75,76,77,73,74,76,
                              78,80,82,84,82,78,
                              75,74,76,79,81,83};
  string key=StringToUppercase(department);
  SubstringReplace(key," ","_");
  for (int i=0;i<nDept;i++){
    if (key==aDept[i]){return aP3_10[i];}
  }
  string avail="";
  for (int i=0;i<nDept;i++){avail+=StringToLowercase(aDept[i])+" ";}
  ExitGracefully("GetDepartmentP3_10: unknown department '"+department+"'. Available: "+avail,BAD_DATA);
  return 0.0;
}
