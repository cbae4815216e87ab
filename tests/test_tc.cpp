/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "TimeOfConcentration.h"

TEST(TimeOfConcentration, KirpichReferenceValue)
{
  double tc_min=TcKirpich(1000.0,0.02)*MIN_PER_HR;
  EXPECT_GT(tc_min,17.5);
  EXPECT_LT(tc_min,18.5);
}

TEST(TimeOfConcentration, KirpichSurfaceFactors)
{
  double natural=TcKirpich(1500.0,0.01,"natural");
  EXPECT_NEAR(TcKirpich(1500.0,0.01,"grassy"),  2.0*natural,1e-12);
  EXPECT_NEAR(TcKirpich(1500.0,0.01,"concrete"),0.4*natural,1e-12);
  EXPECT_NEAR(TcKirpich(1500.0,0.01,"concrete_channel"),0.2*natural,1e-12);
}

TEST(TimeOfConcentration, DesbordesReferenceValue)
{
  double tc_min=TcDesbordes(10.0,2.0,0.5)*MIN_PER_HR;
  EXPECT_GT(tc_min,15.0);
  EXPECT_LT(tc_min,25.0);
  EXPECT_NEAR(TcDesbordes(10.0,2.0,0.5,10.0)-TcDesbordes(10.0,2.0,0.5,5.0),5.0/60.0,1e-12)
    <<"inlet time adds directly to Desbordes Tc";
}

TEST(TimeOfConcentration, EmpiricalFormulaeArePositive)
{
  EXPECT_GT(TcTemez(2.0,0.01),0.0);
  EXPECT_GT(TcCalifornia(2.0,20.0),0.0);
  EXPECT_GT(TcFAA(500.0,2.0,0.5),0.0);
  EXPECT_GT(TcFAA(500.0,2.0,0.3),TcFAA(500.0,2.0,0.8))<<"FAA Tc decreases as C increases";
}

TEST(TimeOfConcentration, InvalidInputsRaise)
{
  EXPECT_THROW(TcKirpich(0.0,0.02),CPluvialException);
  EXPECT_THROW(TcKirpich(1000.0,-0.02),CPluvialException);
  EXPECT_THROW(TcDesbordes(10.0,2.0,1.5),CPluvialException);
  EXPECT_THROW(TcFAA(500.0,2.0,0.0),CPluvialException);
}

TEST(TimeOfConcentration, KinematicWaveConverges)
{
  double tc=TcKinematicWave(100.0,0.05,0.01,50.0);
  double expected=6.99*pow(0.05*100.0,0.6)/(pow(50.0,0.4)*pow(0.01,0.3))/MIN_PER_HR;
  EXPECT_NEAR(tc,expected,1e-12)<<"fixed intensity converges on the second iteration";
}

TEST(TimeOfConcentration, KinematicWaveWithIDFUpdate)
{
  double p[4]={1000.0,0.2,10.0,0.8};
  CIDFCurve IDF(IDF_SHERMAN,p,4);
  double tc=TcKinematicWave(100.0,0.05,0.01,50.0,50,1e-6,&IDF,10.0);
  double i =IDF.GetIntensity(tc*MIN_PER_HR,10.0);
  double tc_check=6.99*pow(0.05*100.0,0.6)/(pow(i,0.4)*pow(0.01,0.3))/MIN_PER_HR;
  EXPECT_NEAR(tc,tc_check,1e-4)<<"converged Tc is consistent with IDF intensity at Tc";
  EXPECT_THROW(TcKinematicWave(100.0,0.05,0.01,50.0,20,0.01,&IDF,PLV_BLANK_DATA),CPluvialException);
}

TEST(NRCSVelocityMethod, EmptySegmentListGivesZero)
{
  vector<nrcs_segment> segs;
  EXPECT_DOUBLE_EQ(NRCSVelocityMethod(segs),0.0);
}

TEST(NRCSVelocityMethod, SumOfSegmentTimes)
{
  vector<nrcs_segment> segs;
  segs.push_back(SheetFlowSegment  (50.0,0.15,0.02));
  segs.push_back(ShallowFlowSegment(300.0,0.02,SURFACE_PAVED));
  segs.push_back(ChannelFlowSegment(800.0,0.04,0.005,0.5));

  double t1=NRCSSheetFlowTime  (50.0,0.15,0.02,DEFAULT_NRCS_P2);
  double t2=NRCSShallowFlowTime(300.0,0.02,SURFACE_PAVED);
  double t3=NRCSChannelFlowTime(800.0,0.04,0.005,0.5);
  EXPECT_NEAR(NRCSVelocityMethod(segs),t1+t2+t3,1e-12);
}

TEST(NRCSVelocityMethod, LargerP2ShortensSheetFlow)
{
  EXPECT_GT(NRCSSheetFlowTime(50.0,0.15,0.02,40.0),NRCSSheetFlowTime(50.0,0.15,0.02,60.0));

  vector<nrcs_segment> segs;
  segs.push_back(SheetFlowSegment(50.0,0.15,0.02,80.0));
  EXPECT_NEAR(NRCSVelocityMethod(segs,40.0),NRCSSheetFlowTime(50.0,0.15,0.02,80.0),1e-12)
    <<"segment P2 overrides method default";
}

TEST(NRCSVelocityMethod, SheetFlowLimitedTo100m)
{
  EXPECT_THROW(NRCSSheetFlowTime(150.0,0.15,0.02,50.0),CPluvialException);
}

TEST(NRCSVelocityMethod, ShallowSurfaceVelocities)
{
  EXPECT_LT(NRCSShallowFlowTime(300.0,0.02,SURFACE_PAVED),NRCSShallowFlowTime(300.0,0.02,SURFACE_SHORT_GRASS));
  EXPECT_EQ(StringToShallowSurface("Paved"),SURFACE_PAVED);
  EXPECT_EQ(StringToShallowSurface("gravel"),SURFACE_UNPAVED);
}

TEST(TcDispatcher, ConvertsUnits)
{
  tc_params P;
  P.length_km=1.0;
  P.slope_pct=2.0;
  tc_result R=CalculateTc(TC_KIRPICH,P);
  EXPECT_NEAR(R.tc_hr,TcKirpich(1000.0,0.02),1e-12);
  EXPECT_DOUBLE_EQ(R.params["length_m"],1000.0);
  EXPECT_DOUBLE_EQ(R.params["slope"],0.02);
}

TEST(TcDispatcher, MissingParametersAreNamed)
{
  tc_params P;
  P.length_m=1000.0;
  try
  {
    CalculateTc(TC_FAA,P);
    FAIL()<<"FAA without slope and C should raise";
  }
  catch (const CPluvialException &e)
  {
    string msg=e.what();
    EXPECT_NE(msg.find("faa"),string::npos);
    EXPECT_NE(msg.find("slope_pct"),string::npos);
    EXPECT_NE(msg.find(" c"),string::npos);
  }
}

TEST(TcDispatcher, NRCSRequiresSegmentsButAcceptsEmptyList)
{
  tc_params P;
  EXPECT_THROW(CalculateTc(TC_NRCS,P),CPluvialException);
  P.has_segments=true;
  EXPECT_DOUBLE_EQ(CalculateTc(TC_NRCS,P).tc_hr,0.0);
}

TEST(TcDispatcher, DesbordesDefaultInletTime)
{
  tc_params P;
  P.area_ha=10.0; P.slope_pct=2.0; P.C=0.5;
  tc_result R=CalculateTc(TC_DESBORDES,P);
  EXPECT_NEAR(R.tc_hr,TcDesbordes(10.0,2.0,0.5,DEFAULT_INLET_TIME),1e-12);
  EXPECT_DOUBLE_EQ(R.params["t0_min"],DEFAULT_INLET_TIME);
}

TEST(TcDispatcher, MethodTags)
{
  EXPECT_EQ(StringToTcMethod("Kirpich"),TC_KIRPICH);
  EXPECT_EQ(StringToTcMethod("desbordes"),TC_DESBORDES);
  EXPECT_EQ(TcMethodToString(TC_CALIFORNIA),"california");
  EXPECT_THROW(StringToTcMethod("giandotti"),CPluvialException);
}
