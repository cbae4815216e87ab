/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "UnitHydrograph.h"

TEST(UnitHydrograph, SCSTiming)
{
  EXPECT_NEAR(SCSLagTime(1.0),0.6,1e-12);
  EXPECT_NEAR(SCSTimeToPeak(1.0,0.1),0.65,1e-12);
  EXPECT_NEAR(SCSTimeBase(1.0),2.67,1e-12);
}

TEST(UnitHydrograph, RecommendedTimeStep)
{
  EXPECT_NEAR(RecommendedDt(1.0),0.133,1e-12);
  EXPECT_NEAR(RecommendedDt(0.3),5.0/60.0,1e-12)<<"absolute minimum of 5 minutes";
  EXPECT_NEAR(RecommendedDt(1.0,"scs_ii"),0.25,1e-12)<<"24-hr SCS storms use at least 15 minutes";
  EXPECT_NEAR(RecommendedDt(0.3,"",10.0),10.0/60.0,1e-12);
}

TEST(UnitHydrograph, TriangularShape)
{
  unit_hydrograph UH=TriangularUHX(100.0,1.0,0.1,1.0);
  EXPECT_NEAR(UH.tp_hr,0.65,1e-12);
  EXPECT_NEAR(UH.tb_hr,1.30,1e-12);
  EXPECT_NEAR(UH.qp_m3s,0.278/0.65,1e-12);
  ASSERT_EQ(UH.time_hr.size(),UH.flow_m3s.size());
  EXPECT_DOUBLE_EQ(UH.time_hr.front(),0.0);
  EXPECT_GE(UH.time_hr.back(),UH.tb_hr-1e-9);
  EXPECT_LT(UH.time_hr.back(),UH.tb_hr+0.1+1e-9);
  for (int k=0;k<(int)(UH.time_hr.size());k++){
    EXPECT_NEAR(UH.time_hr[k],k*0.1,1e-12);
  }
  EXPECT_DOUBLE_EQ(UH.flow_m3s.front(),0.0);
  EXPECT_NEAR(UH.flow_m3s.back(),0.0,1e-12);
  EXPECT_NEAR(VectorMax(UH.flow_m3s),UH.qp_m3s,0.05*UH.qp_m3s);
}

TEST(UnitHydrograph, VolumeIsOneMillimetre)
{
  double X[3]={1.0,2.0,5.0};
  for (int k=0;k<3;k++)
  {
    unit_hydrograph UH=TriangularUHX(250.0,0.8,5.0/60.0,X[k]);
    vector<double> tsec(UH.time_hr.size());
    for (int i=0;i<(int)(tsec.size());i++){tsec[i]=UH.time_hr[i]*SEC_PER_HR;}
    double vol=TrapezoidIntegral(UH.flow_m3s,tsec);
    EXPECT_NEAR(vol,1000.0*2.5,1e-6)<<"X="<<X[k];
    EXPECT_NEAR(UH.time_hr[1],5.0/60.0,1e-12);
    EXPECT_NEAR(UH.tb_hr,(1.0+X[k])*UH.tp_hr,1e-12);
  }
  EXPECT_THROW(TriangularUHX(250.0,0.8,0.1,0.5),CPluvialException);
  EXPECT_THROW(TriangularUHX(0.0,0.8,0.1,1.0),CPluvialException);
}

TEST(UnitHydrograph, LargerXFlattensPeak)
{
  unit_hydrograph U1=TriangularUHX(100.0,1.0,0.1,1.0);
  unit_hydrograph U3=TriangularUHX(100.0,1.0,0.1,3.0);
  EXPECT_NEAR(U3.qp_m3s,U1.qp_m3s*0.5,1e-12);
  EXPECT_GT(U3.tb_hr,U1.tb_hr);
}

TEST(UnitHydrograph, SCSTriangular)
{
  unit_hydrograph UH=SCSTriangularUH(2.0,0.625,0.25);
  EXPECT_NEAR(UH.tp_hr,0.5,1e-12);
  EXPECT_NEAR(UH.tb_hr,1.335,1e-12);
  EXPECT_NEAR(UH.qp_m3s,0.208*2.0/0.5,1e-12);
  EXPECT_DOUBLE_EQ(UH.x_factor,SCS_X_FACTOR);
  EXPECT_NEAR(VectorMax(UH.flow_m3s),UH.qp_m3s,0.05*UH.qp_m3s);
  EXPECT_THROW(SCSTriangularUH(2.0,0.0,0.25),CPluvialException);
}

TEST(Convolution, DiscreteSum)
{
  double p[2]={1,2};
  double u[3]={1,1,1};
  vector<double> Q=ConvolveUH(vector<double>(p,p+2),vector<double>(u,u+3));
  ASSERT_EQ((int)(Q.size()),4);
  EXPECT_DOUBLE_EQ(Q[0],1.0);
  EXPECT_DOUBLE_EQ(Q[1],3.0);
  EXPECT_DOUBLE_EQ(Q[2],3.0);
  EXPECT_DOUBLE_EQ(Q[3],2.0);

  vector<double> empty;
  EXPECT_TRUE(ConvolveUH(empty,vector<double>(u,u+3)).empty());
}

TEST(Convolution, HydrographFromImpulse)
{
  //Tb is a whole number of steps, so ordinates fall on the hydrograph time grid
  unit_hydrograph UH=TriangularUHX(100.0,0.625,0.25,1.0);
  ASSERT_EQ((int)(UH.flow_m3s.size()),5);

  vector<double> ex(1,10.0);
  hydrograph_result HG=GenerateHydrograph(ex,UH,0.25);
  EXPECT_EQ(HG.flow_m3s.size(),UH.flow_m3s.size());
  EXPECT_NEAR(HG.peak_flow_m3s,10.0*UH.qp_m3s*(1000.0/1000.8),1e-9);
  EXPECT_NEAR(HG.time_to_peak_hr,0.5,1e-12);
  EXPECT_NEAR(HG.volume_m3,10.0*1000.0,1e-6);
  EXPECT_DOUBLE_EQ(HG.runoff_mm,10.0);
  EXPECT_DOUBLE_EQ(HG.x_factor,1.0);
}

TEST(Convolution, HydrographVolumeMatchesRunoff)
{
  unit_hydrograph UH=TriangularUHX(100.0,0.625,0.25,1.0);
  double e[3]={2,5,3};
  hydrograph_result HG=GenerateHydrograph(vector<double>(e,e+3),UH,0.25);
  EXPECT_EQ((int)(HG.flow_m3s.size()),3+5-1);
  EXPECT_NEAR(HG.volume_m3,10.0*1000.0,1e-6);
  EXPECT_NEAR(HG.time_hr[1],0.25,1e-12);
  EXPECT_GE(HG.peak_flow_m3s,5.0*UH.qp_m3s*0.999);

  vector<double> none;
  EXPECT_THROW(GenerateHydrograph(none,UH,0.25),CPluvialException);
}

//////////////////////////////////////////////////////////////////
// volume of unit hydrographs whose time base is not a whole number of steps
//
static double UHVolume(const unit_hydrograph &UH)
{
  vector<double> tsec(UH.time_hr.size());
  for (int i=0;i<(int)(tsec.size());i++){tsec[i]=UH.time_hr[i]*SEC_PER_HR;}
  return TrapezoidIntegral(UH.flow_m3s,tsec);
}

TEST(UnitHydrograph, ShortTimeBaseHoldsRunoffVolume)
{
  //Tb=0.283 hr is 3.4 five-minute steps
  double dt=5.0/60.0;
  unit_hydrograph UH=TriangularUHX(100.0,10.0/60.0,dt,1.0);
  EXPECT_NEAR(UHVolume(UH),1000.0,1e-6);

  hydrograph_result HG=GenerateHydrograph(vector<double>(1,10.0),UH,dt);
  EXPECT_NEAR(HG.volume_m3,10000.0,1e-6);
}

TEST(UnitHydrograph, SCSTriangularHoldsRunoffVolume)
{
  double dt=10.0/60.0;
  unit_hydrograph UH=SCSTriangularUH(1.0,0.5,dt);
  EXPECT_NEAR(UHVolume(UH),1000.0,1e-6);
  EXPECT_NEAR(UH.qp_m3s,0.208*1.0/UH.tp_hr,1e-12);

  hydrograph_result HG=GenerateHydrograph(vector<double>(1,10.0),UH,dt);
  EXPECT_NEAR(HG.volume_m3,10000.0,1e-6);
  EXPECT_EQ(HG.uh_tag,"scs_triangular");
}

TEST(UnitHydrograph, EveryMethodHoldsOneMillimetre)
{
  unit_hydrograph_params P;
  P.area_km2 =2.0;
  P.tc_hr    =1.0;
  P.dt_hr    =0.1;
  P.length_km=5.0;
  P.lc_km    =2.5;

  uh_method M[6]={UH_TRIANGULAR_X,UH_SCS_TRIANGULAR,UH_SCS_CURVILINEAR,UH_GAMMA,UH_SNYDER,UH_CLARK};
  for (int i=0;i<6;i++)
  {
    unit_hydrograph UH=GenerateUnitHydrograph(M[i],P);
    EXPECT_EQ(UH.method,M[i]);
    EXPECT_NEAR(UHVolume(UH),2000.0,1e-6)<<UHMethodToString(M[i]);
    EXPECT_DOUBLE_EQ(UH.flow_m3s.front(),0.0)<<UHMethodToString(M[i]);
    EXPECT_DOUBLE_EQ(UH.flow_m3s.back(),0.0)<<UHMethodToString(M[i]);
    EXPECT_NEAR(UH.time_hr[1],0.1,1e-12)<<UHMethodToString(M[i]);
    EXPECT_GT(UH.tb_hr,UH.tp_hr)<<UHMethodToString(M[i]);
  }
}

TEST(UnitHydrograph, SnyderParameters)
{
  //one mile channel and centroid distance gives tp=Ct
  double L=1.0/MILES_PER_KM;
  EXPECT_NEAR(SnyderLagTime(L,L,2.0),2.0,1e-9);
  EXPECT_NEAR(SnyderLagTime(L,L,1.8),1.8,1e-9);

  double A=1.0/SQMI_PER_KM2; //one square mile
  double qp=SnyderPeak(A,2.0,0.6);
  EXPECT_NEAR(qp,192.0*M3S_PER_CFS,1e-9);

  double W50,W75;
  SnyderWidths(qp,A,W50,W75);
  EXPECT_NEAR(W50,770.0*pow(192.0,-1.08),1e-9);
  EXPECT_NEAR(W75/W50,440.0/770.0,1e-12);

  EXPECT_THROW(SnyderLagTime(0.0,L),CPluvialException);
  EXPECT_THROW(SnyderPeak(A,0.0),CPluvialException);
}

TEST(UnitHydrograph, SnyderShape)
{
  unit_hydrograph UH=SnyderUH(2.0,5.0,2.5,0.1);
  double tp=SnyderLagTime(5.0,2.5);
  double W50,W75;
  SnyderWidths(SnyderPeak(2.0,tp),2.0,W50,W75);
  EXPECT_NEAR(UH.tp_hr,tp,1e-12);
  EXPECT_NEAR(UH.tb_hr,tp+3.0*W50,1e-12);
  EXPECT_NEAR(UH.qp_m3s,SnyderPeak(2.0,tp)/MM_PER_INCH,1e-12);
  EXPECT_NEAR(UH.time_hr[VectorArgMax(UH.flow_m3s)],tp,0.1+1e-9);
}

TEST(UnitHydrograph, CurvilinearPeakRateFactor)
{
  unit_hydrograph U484=SCSCurvilinearUH(2.0,1.0,0.1);
  unit_hydrograph U600=SCSCurvilinearUH(2.0,1.0,0.1,600.0);
  EXPECT_NEAR(U484.qp_m3s,0.208*2.0/U484.tp_hr,1e-12);
  EXPECT_NEAR(U600.qp_m3s,U484.qp_m3s*600.0/484.0,1e-12);
  EXPECT_GT(VectorMax(U600.flow_m3s),VectorMax(U484.flow_m3s));
  EXPECT_LT(U600.tb_hr,U484.tb_hr);
  EXPECT_NEAR(U484.tb_hr,5.0*U484.tp_hr,0.01*U484.tp_hr)<<"standard PRF keeps the tabulated 5 Tp base";
  EXPECT_NEAR(UHVolume(U600),2000.0,1e-6);

  EXPECT_THROW(SCSCurvilinearUH(2.0,1.0,0.1,1500.0),CPluvialException);
  EXPECT_THROW(SCSCurvilinearUH(2.0,1.0,0.1,0.0),CPluvialException);
}

TEST(UnitHydrograph, GammaPeaksAtTp)
{
  unit_hydrograph UH=GammaUH(2.0,1.0,0.1);
  EXPECT_NEAR(UH.tp_hr,0.65,1e-12);
  EXPECT_NEAR(UH.tb_hr,5.0*0.65,1e-12);
  EXPECT_NEAR(UH.time_hr[VectorArgMax(UH.flow_m3s)],UH.tp_hr,0.1);
  EXPECT_NEAR(UH.qp_m3s,2000.0/(SEC_PER_HR*0.65*1.3327),0.005*UH.qp_m3s);

  unit_hydrograph U6=GammaUH(2.0,1.0,0.1,6.0);
  EXPECT_GT(VectorMax(U6.flow_m3s),VectorMax(UH.flow_m3s))<<"larger shape parameter gives a sharper peak";
  EXPECT_THROW(GammaUH(2.0,1.0,0.1,0.0),CPluvialException);
}

TEST(UnitHydrograph, ClarkTimeAreaAndStorage)
{
  EXPECT_DOUBLE_EQ(ClarkTimeArea(0.0),0.0);
  EXPECT_NEAR(ClarkTimeArea(0.5),0.5,1e-3);
  EXPECT_DOUBLE_EQ(ClarkTimeArea(1.0),1.0);
  EXPECT_DOUBLE_EQ(ClarkTimeArea(2.0),1.0);
  EXPECT_LT(ClarkTimeArea(0.25),ClarkTimeArea(0.75));

  unit_hydrograph U1=ClarkUH(2.0,1.0,0.5,0.1);
  unit_hydrograph U2=ClarkUH(2.0,1.0,2.0,0.1);
  EXPECT_DOUBLE_EQ(U1.qp_m3s,VectorMax(U1.flow_m3s));
  EXPECT_NEAR(U1.tb_hr,1.0+5.0*0.5,1e-12);
  EXPECT_GT(U1.qp_m3s,U2.qp_m3s)<<"more storage attenuates the peak";
  EXPECT_NEAR(UHVolume(U2),2000.0,1e-6);
  EXPECT_THROW(ClarkUH(2.0,1.0,0.0,0.1),CPluvialException);
}

TEST(UnitHydrograph, GenerateByMethod)
{
  unit_hydrograph_params P;
  P.area_km2=1.0;
  P.dt_hr   =0.1;
  EXPECT_THROW(GenerateUnitHydrograph(UH_SCS_TRIANGULAR,P),CPluvialException)<<"no Tc";
  EXPECT_THROW(GenerateUnitHydrograph(UH_SNYDER,P),CPluvialException)<<"no channel lengths";

  P.tc_hr=1.0;
  P.X    =2.0;
  unit_hydrograph UX=GenerateUnitHydrograph(UH_TRIANGULAR_X,P);
  unit_hydrograph UD=TriangularUHX(100.0,1.0,0.1,2.0);
  EXPECT_DOUBLE_EQ(UX.qp_m3s,UD.qp_m3s);
  ASSERT_EQ(UX.flow_m3s.size(),UD.flow_m3s.size());

  //Clark storage defaults to 2 Tc
  unit_hydrograph UC=GenerateUnitHydrograph(UH_CLARK,P);
  EXPECT_NEAR(UC.tb_hr,1.0+5.0*2.0,1e-12);

  P.length_km=5.0;
  EXPECT_THROW(GenerateUnitHydrograph(UH_SNYDER,P),CPluvialException)<<"no centroid distance";
  P.lc_km=2.0;
  EXPECT_EQ(GenerateUnitHydrograph(UH_SNYDER,P).method,UH_SNYDER);
}

TEST(UnitHydrograph, MethodTags)
{
  uh_method M[6]={UH_TRIANGULAR_X,UH_SCS_TRIANGULAR,UH_SCS_CURVILINEAR,UH_GAMMA,UH_SNYDER,UH_CLARK};
  for (int i=0;i<6;i++){
    EXPECT_EQ(StringToUHMethod(UHMethodToString(M[i])),M[i]);
  }
  EXPECT_EQ(StringToUHMethod("SCS"),UH_SCS_TRIANGULAR);
  EXPECT_EQ(StringToUHMethod("x"),UH_TRIANGULAR_X);
  EXPECT_EQ(StringToUHMethod("Clark"),UH_CLARK);
  EXPECT_THROW(StringToUHMethod("nash"),CPluvialException);
  EXPECT_THROW(StringToUHMethod(""),CPluvialException);
}

TEST(Convolution, TimeStepMustMatchOrdinates)
{
  unit_hydrograph UH=TriangularUHX(100.0,0.625,0.25,1.0);
  EXPECT_THROW(GenerateHydrograph(vector<double>(2,1.0),UH,0.1),CPluvialException);
}
