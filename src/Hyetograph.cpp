/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include "Hyetograph.h"

/*****************************************************************
   Shared utilities
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief returns number of whole time steps in storm
/// \param duration_hr [in] storm duration [hr]
/// \param dt_min [in] time step [min]
//
int NumStormIntervals(const double &duration_hr, const double &dt_min)
{
  ExitGracefullyIf(duration_hr<=0,"NumStormIntervals: storm duration must be positive",BAD_DATA);
  ExitGracefullyIf(dt_min<=0,     "NumStormIntervals: time step must be positive",BAD_DATA);
  int n=(int)(duration_hr*MIN_PER_HR/dt_min+1e-9); //tolerance for round-off in e.g. 0.35*60/7
  ExitGracefullyIf(n<1,"NumStormIntervals: time step exceeds storm duration",BAD_DATA);
  return n;
}

//////////////////////////////////////////////////////////////////
/// \brief fills in derived hyetograph quantities from depth series
//
void BuildHyetograph(hyetograph_result &H, const vector<double> &time_min, const vector<double> &depth_mm,
                     const double &dt_min, const string method)
{
  H.time_min =time_min;
  H.depth_mm =depth_mm;
  H.dt_min   =dt_min;
  H.method   =method;
  H.intensity_mmhr.resize(depth_mm.size());
  for (int i=0;i<(int)(depth_mm.size());i++){
    H.intensity_mmhr[i]=depth_mm[i]*MIN_PER_HR/dt_min;
  }
  H.cumulative_mm       =CumulativeSum(depth_mm);
  H.total_depth_mm      =VectorSum(depth_mm);
  H.peak_intensity_mmhr =VectorMax(H.intensity_mmhr);
}

//////////////////////////////////////////////////////////////////
/// \brief interval centres i*dt+dt/2 [min]
//
vector<double> IntervalCentres(const int n, const double &dt_min)
{
  vector<double> t(n);
  for (int i=0;i<n;i++){t[i]=i*dt_min+0.5*dt_min;}
  return t;
}

//////////////////////////////////////////////////////////////////
/// \brief scales all entries so that they sum to total (unchanged if sum is zero)
//
void ScaleToTotal(vector<double> &depths, const double &total)
{
  double sum=VectorSum(depths);
  if (sum<=0.0){return;}
  for (int i=0;i<(int)(depths.size());i++){depths[i]*=total/sum;}
}

//////////////////////////////////////////////////////////////////
/// \brief places sorted (largest first) increments alternately about a peak index
/// \param sorted_increments [in] depth increments sorted in descending order
/// \param nIntervals [in] number of intervals in storm
/// \param peak_position [in] relative location of peak within storm [0..1]
/// \return re-ordered depth array of size nIntervals
//
vector<double> DistributeAlternatingBlocks(const vector<double> &sorted_increments, const int nIntervals, const double &peak_position)
{
  ExitGracefullyIf((peak_position<0.0) || (peak_position>1.0),
                   "DistributeAlternatingBlocks: peak position must be between 0 and 1",BAD_DATA);
  vector<double> out(nIntervals,0.0);
  int peak =min((int)(peak_position*nIntervals),nIntervals-1);
  int left =peak;
  int right=peak+1;
  bool goleft=true;

  for (int k=0;k<(int)(sorted_increments.size());k++)
  {
    if      ((goleft)  && (left>=0))         {out[left ]=sorted_increments[k];left--;}
    else if ((!goleft) && (right<nIntervals)){out[right]=sorted_increments[k];right++;}
    else if (left>=0)                        {out[left ]=sorted_increments[k];left--;}
    else if (right<nIntervals)               {out[right]=sorted_increments[k];right++;}
    goleft=!goleft;
  }
  return out;
}

//////////////////////////////////////////////////////////////////
/// \brief shared alternating block construction from cumulative depth series
//
hyetograph_result AlternatingBlocksFromCumulative(const vector<double> &cumul, const double &dt_min,
                                                  const double &peak_position, const string method)
{
  int n=(int)(cumul.size());
  vector<double> incr=Differences(cumul);
  for (int i=0;i<n;i++){incr[i]=max(incr[i],0.0);}
  sort(incr.begin(),incr.end(),greater<double>());

  hyetograph_result H;
  BuildHyetograph(H,IntervalCentres(n,dt_min),DistributeAlternatingBlocks(incr,n,peak_position),dt_min,method);
  return H;
}

/*****************************************************************
   Alternating block method
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief alternating block hyetograph from IDF depth-duration relation
/// \param total_depth_mm [in] target storm depth [mm] (PLV_BLANK_DATA to use IDF total)
/// \param duration_hr [in] storm duration [hr]
/// \param dt_min [in] time step [min]
/// \param IDF [in] IDF curve
/// \param Tr [in] return period [yr]
/// \param peak_position [in] relative peak position [0..1]
//
hyetograph_result AlternatingBlocks(const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                    const CIDFCurve &IDF, const double &Tr, const double &peak_position)
{
  int n=NumStormIntervals(duration_hr,dt_min);

  vector<double> cumul(n);
  for (int i=0;i<n;i++){
    cumul[i]=IDF.GetDepth((i+1)*dt_min,Tr);
  }
  double idf_total=cumul[n-1];
  if ((total_depth_mm!=PLV_BLANK_DATA) && (fabs(idf_total-total_depth_mm)>0.01) && (idf_total>0.0))
  {
    double scale=total_depth_mm/idf_total;
    for (int i=0;i<n;i++){cumul[i]*=scale;}
  }
  return AlternatingBlocksFromCumulative(cumul,dt_min,peak_position,"alternating_blocks");
}

//////////////////////////////////////////////////////////////////
/// \brief alternating block hyetograph using DINAGUA depth-duration relation
/// \note depths are not rescaled; total equals DINAGUA depth for full duration
//
hyetograph_result AlternatingBlocksDinagua(const double &P3_10, const double &Tr, const double &duration_hr, const double &dt_min,
                                           const double &area_km2, const double &peak_position)
{
  int n=NumStormIntervals(duration_hr,dt_min);

  vector<double> cumul(n);
  for (int i=0;i<n;i++){
    cumul[i]=DinaguaDepth(P3_10,Tr,(i+1)*dt_min/MIN_PER_HR,area_km2);
  }
  return AlternatingBlocksFromCumulative(cumul,dt_min,peak_position,"alternating_blocks_dinagua");
}

/*****************************************************************
   Chicago (Keifer-Chu) storm
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief Chicago storm intensity at time t from storm start
/// \param a [in] IDF numerator k*T^m
/// \param b [in] IDF time offset c [min]
/// \param cexp [in] IDF exponent n
/// \param tpeak [in] time of peak [min]
/// \param r [in] advancement coefficient
//
double ChicagoIntensity(const double &t, const double &a, const double &b, const double &cexp,
                        const double &tpeak, const double &r)
{
  double tau;
  if (t<=tpeak){tau=(tpeak-t)/r;}
  else         {tau=(t-tpeak)/(1.0-r);}
  return a*((1.0-cexp)*tau+b)/pow(tau+b,cexp+1.0);
}

//////////////////////////////////////////////////////////////////
/// \brief Chicago design storm, scaled to target depth
/// \param IDF [in] Sherman-type IDF curve supplying k,m,c,n
/// \param r [in] advancement coefficient (0<r<1)
//
hyetograph_result ChicagoStorm(const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                               const CIDFCurve &IDF, const double &Tr, const double &r)
{
  ExitGracefullyIf(IDF.GetType()!=IDF_SHERMAN,"ChicagoStorm: Chicago storm requires Sherman IDF coefficients",BAD_DATA);
  ExitGracefullyIf((r<=0.0) || (r>=1.0),"ChicagoStorm: advancement coefficient must be between 0 and 1",BAD_DATA);
  ExitGracefullyIf(Tr<=0,"ChicagoStorm: return period must be positive",BAD_DATA);

  int n=NumStormIntervals(duration_hr,dt_min);

  double a    =IDF.GetParameter(0)*pow(Tr,IDF.GetParameter(1));
  double b    =IDF.GetParameter(2);
  double cexp =IDF.GetParameter(3);
  double tpeak=r*duration_hr*MIN_PER_HR;

  vector<double> t=IntervalCentres(n,dt_min);
  vector<double> depth(n);
  for (int i=0;i<n;i++){
    depth[i]=ChicagoIntensity(t[i],a,b,cexp,tpeak,r)*dt_min/MIN_PER_HR;
  }
  if (total_depth_mm!=PLV_BLANK_DATA){ScaleToTotal(depth,total_depth_mm);}

  hyetograph_result H;
  BuildHyetograph(H,t,depth,dt_min,"chicago");
  return H;
}

/*****************************************************************
   Dimensionless mass curve methods
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief SCS 24-hour storm distribution, stretched over storm duration
/// \param type [in] SCS storm type
/// \param Registry [in] reference distributions
//
hyetograph_result SCSDistribution(const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                  const scs_storm_type type, const CDistributionRegistry &Registry)
{
  ExitGracefullyIf(total_depth_mm<0,"SCSDistribution: negative storm depth",BAD_DATA);
  int n=NumStormIntervals(duration_hr,dt_min);
  const CLookupTable *pCurve=Registry.GetSCSDistribution(type);

  //reference curve abscissa is in hours of a 24 hour storm
  vector<double> tinterp=Linspace(0.0,duration_hr,n+1);
  vector<double> cumul(n+1);
  for (int i=0;i<=n;i++){
    cumul[i]=pCurve->GetValue(tinterp[i]*24.0/duration_hr)*total_depth_mm;
  }
  vector<double> depth(n),t(n);
  for (int i=0;i<n;i++){
    depth[i]=cumul[i+1]-cumul[i];
    t[i]=0.5*(tinterp[i]+tinterp[i+1])*MIN_PER_HR;
  }
  hyetograph_result H;
  BuildHyetograph(H,t,depth,dt_min,SCSStormTypeToString(type));
  H.cumulative_mm.assign(cumul.begin()+1,cumul.end());
  return H;
}

//////////////////////////////////////////////////////////////////
/// \brief reads optional _qN and _pN suffixes of a "huff" distribution name
/// \param dist [in] lowercase name, e.g. "huff", "huff_q3", "huff_q1_p90", "huff_p10"
/// \param quartile [in/out] quartile, unchanged without _qN
/// \param probability [in/out] probability curve, unchanged without _pN
//
static void ParseHuffSuffix(const string &dist, int &quartile, int &probability)
{
  string rest=dist.substr(4);
  while (!rest.empty())
  {
    size_t next=rest.find('_',1);
    string tok =rest.substr(1,(next==string::npos) ? string::npos : next-1);
    string val =(tok.size()>1) ? tok.substr(1) : "";
    bool   good=(rest[0]=='_') && (!val.empty()) && (val.find_first_not_of("0123456789")==string::npos);
    if      (good && (tok[0]=='q')){quartile   =s_to_i(val.c_str());}
    else if (good && (tok[0]=='p')){probability=s_to_i(val.c_str());}
    else {
      ExitGracefully("CustomDepthStorm: bad Huff distribution '"+dist+"'. Use huff[_qN][_pN]",BAD_DATA);
    }
    rest=(next==string::npos) ? "" : rest.substr(next);
  }
}

//////////////////////////////////////////////////////////////////
/// \brief Huff quartile storm distribution
/// \param quartile [in] Huff quartile (1-4)
/// \param probability [in] exceedance probability curve (10, 50, or 90)
//
hyetograph_result HuffDistribution(const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                   const int quartile, const int probability, const CDistributionRegistry &Registry)
{
  ExitGracefullyIf(total_depth_mm<0,"HuffDistribution: negative storm depth",BAD_DATA);
  int n=NumStormIntervals(duration_hr,dt_min);
  const CLookupTable *pCurve=Registry.GetHuffCurve(quartile,probability);

  vector<double> pct =Linspace(0.0,100.0,n+1);
  vector<double> tmin=Linspace(0.0,duration_hr*MIN_PER_HR,n+1);
  vector<double> cumul(n+1);
  for (int i=0;i<=n;i++){
    cumul[i]=pCurve->GetValue(pct[i])/100.0*total_depth_mm;
  }
  vector<double> depth(n),t(n);
  for (int i=0;i<n;i++){
    depth[i]=cumul[i+1]-cumul[i];
    t[i]=0.5*(tmin[i]+tmin[i+1]);
  }
  hyetograph_result H;
  BuildHyetograph(H,t,depth,dt_min,"huff_q"+to_string(quartile)+"_p"+to_string(probability));
  H.cumulative_mm.assign(cumul.begin()+1,cumul.end());
  return H;
}

/*****************************************************************
   Bimodal storms
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief triangular pulse over normalized time, scaled to enclose given volume
//
vector<double> TriangularPulse(const vector<double> &tnorm, const double &centre, const double &width, const double &volume)
{
  int n=(int)(tnorm.size());
  vector<double> p(n,0.0);
  double left =centre-width;
  double right=centre+width;
  for (int i=0;i<n;i++)
  {
    double t=tnorm[i];
    if      ((t>=left) && (t<=centre)){p[i]=(t-left)/(centre-left);}
    else if ((t>centre) && (t<=right)){p[i]=(right-t)/(right-centre);}
  }
  double area=TrapezoidIntegral(p,tnorm);
  if (area>0.0){
    for (int i=0;i<n;i++){p[i]*=volume/area;}
  }
  return p;
}

//////////////////////////////////////////////////////////////////
void CheckBimodalParameters(const double &peak1, const double &peak2, const double &volume_split)
{
  ExitGracefullyIf((peak1<0.0) || (peak1>1.0) || (peak2<0.0) || (peak2>1.0),
                   "Bimodal storm: peak positions must be between 0 and 1",BAD_DATA);
  ExitGracefullyIf((volume_split<0.0) || (volume_split>1.0),
                   "Bimodal storm: volume split must be between 0 and 1",BAD_DATA);
}

//////////////////////////////////////////////////////////////////
/// \brief bimodal storm from two triangular pulses
/// \param peak1,peak2 [in] relative peak times [0..1]
/// \param volume_split [in] fraction of total depth in first pulse
/// \param peak_width [in] half-width of each pulse, relative to storm duration
//
hyetograph_result BimodalStorm(const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                               const double &peak1, const double &peak2,
                               const double &volume_split, const double &peak_width)
{
  ExitGracefullyIf(total_depth_mm<0,"BimodalStorm: negative storm depth",BAD_DATA);
  ExitGracefullyIf(peak_width<=0,"BimodalStorm: peak width must be positive",BAD_DATA);
  CheckBimodalParameters(peak1,peak2,volume_split);
  int n=NumStormIntervals(duration_hr,dt_min);

  vector<double> t=IntervalCentres(n,dt_min);
  vector<double> tnorm(n);
  for (int i=0;i<n;i++){tnorm[i]=t[i]/(duration_hr*MIN_PER_HR);}

  vector<double> p1=TriangularPulse(tnorm,peak1,peak_width,total_depth_mm*volume_split);
  vector<double> p2=TriangularPulse(tnorm,peak2,peak_width,total_depth_mm*(1.0-volume_split));
  vector<double> depth(n);
  for (int i=0;i<n;i++){depth[i]=p1[i]+p2[i];}

  ExitGracefullyIf((VectorSum(depth)<=0.0) && (total_depth_mm>0.0),
                   "BimodalStorm: time step too coarse to resolve storm peaks",BAD_DATA);
  ScaleToTotal(depth,total_depth_mm);

  hyetograph_result H;
  BuildHyetograph(H,t,depth,dt_min,"bimodal");
  return H;
}

//////////////////////////////////////////////////////////////////
/// \brief bimodal storm with DINAGUA total depth
//
hyetograph_result BimodalDinagua(const double &P3_10, const double &Tr, const double &duration_hr, const double &dt_min,
                                 const double &area_km2,
                                 const double &peak1, const double &peak2,
                                 const double &volume_split, const double &peak_width)
{
  double total=DinaguaDepth(P3_10,Tr,duration_hr,area_km2);
  hyetograph_result H=BimodalStorm(total,duration_hr,dt_min,peak1,peak2,volume_split,peak_width);
  H.method="bimodal_dinagua";
  return H;
}

//////////////////////////////////////////////////////////////////
/// \brief bimodal storm from superposition of two Chicago storms
//
hyetograph_result BimodalChicago(const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                 const CIDFCurve &IDF, const double &Tr,
                                 const double &peak1, const double &peak2, const double &volume_split)
{
  ExitGracefullyIf(total_depth_mm<0,"BimodalChicago: negative storm depth",BAD_DATA);
  CheckBimodalParameters(peak1,peak2,volume_split);

  hyetograph_result H1=ChicagoStorm(total_depth_mm*volume_split,      duration_hr,dt_min,IDF,Tr,peak1);
  hyetograph_result H2=ChicagoStorm(total_depth_mm*(1.0-volume_split),duration_hr,dt_min,IDF,Tr,peak2);

  int n=(int)(H1.depth_mm.size());
  vector<double> depth(n);
  for (int i=0;i<n;i++){depth[i]=H1.depth_mm[i]+H2.depth_mm[i];}
  ScaleToTotal(depth,total_depth_mm);

  hyetograph_result H;
  BuildHyetograph(H,H1.time_min,depth,dt_min,"bimodal_chicago");
  return H;
}

/*****************************************************************
   User-specified storms
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief distributes a known total depth with a named temporal pattern
/// \param distribution [in] one of uniform, triangular, alternating_blocks, scs_type_*, huff[_qN][_pN]
/// \param peak_position [in] relative peak position for alternating_blocks
/// \param huff_quartile [in] quartile used when distribution is "huff" without suffix
//
hyetograph_result CustomDepthStorm(const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                   const string distribution, const CDistributionRegistry &Registry,
                                   const double &peak_position, const int huff_quartile)
{
  ExitGracefullyIf(total_depth_mm<0,"CustomDepthStorm: negative storm depth",BAD_DATA);
  string dist=StringToLowercase(distribution);
  hyetograph_result H;

  if (dist.substr(0,9)=="scs_type_")
  {
    H=SCSDistribution(total_depth_mm,duration_hr,dt_min,StringToSCSStormType(dist),Registry);
    H.method="custom_"+H.method;
    return H;
  }
  else if (dist.substr(0,4)=="huff")
  {
    int q=huff_quartile;
    int prob=50;
    ParseHuffSuffix(dist,q,prob);
    H=HuffDistribution(total_depth_mm,duration_hr,dt_min,q,prob,Registry);
    H.method="custom_"+H.method;
    return H;
  }

  int n=NumStormIntervals(duration_hr,dt_min);
  vector<double> depth(n,0.0);
  if (dist=="uniform")
  {
    for (int i=0;i<n;i++){depth[i]=total_depth_mm/n;}
  }
  else if (dist=="triangular")
  {
    int peak=n/2;
    for (int i=0;i<n;i++){
      if (i<=peak){depth[i]=(peak==0) ? 1.0 : (double)(i)/peak;}
      else        {depth[i]=(double)(n-1-i)/(n-1-peak);}
    }
    ScaleToTotal(depth,total_depth_mm);
  }
  else if (dist=="alternating_blocks")
  {
    //synthetic depth-duration curve P(t)=P*(t/D)^0.6
    vector<double> cumul(n);
    for (int i=0;i<n;i++){cumul[i]=total_depth_mm*pow((double)(i+1)/n,0.6);}
    vector<double> incr=Differences(cumul);
    sort(incr.begin(),incr.end(),greater<double>());
    depth=DistributeAlternatingBlocks(incr,n,peak_position);
  }
  else
  {
    ExitGracefully("CustomDepthStorm: unrecognized temporal distribution '"+distribution+"'",BAD_DATA);
  }
  BuildHyetograph(H,IntervalCentres(n,dt_min),depth,dt_min,"custom_"+dist);
  return H;
}

//////////////////////////////////////////////////////////////////
/// \brief hyetograph from user-supplied time/depth pairs
/// \param time_min [in] interval times [min], uniformly spaced
/// \param depth_mm [in] interval depths [mm]
//
hyetograph_result CustomHyetograph(const vector<double> &time_min, const vector<double> &depth_mm)
{
  ExitGracefullyIf(time_min.size()!=depth_mm.size(),"CustomHyetograph: time and depth series must have same length",BAD_DATA);
  ExitGracefullyIf(time_min.size()<2,"CustomHyetograph: at least two time/depth pairs required",BAD_DATA);
  double dt=time_min[1]-time_min[0];
  ExitGracefullyIf(dt<=0,"CustomHyetograph: time values must be increasing",BAD_DATA);
  for (int i=0;i<(int)(depth_mm.size());i++){
    ExitGracefullyIf(depth_mm[i]<0,"CustomHyetograph: negative rainfall depth",BAD_DATA);
  }
  hyetograph_result H;
  BuildHyetograph(H,time_min,depth_mm,dt,"custom_event");
  return H;
}
