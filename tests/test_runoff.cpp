/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "RainfallExcess.h"

//simple 4-interval storm, 60 mm in 40 minutes
static hyetograph_result TestStorm()
{
  double t[4]={5,15,25,35};
  double d[4]={10,25,15,10};
  return CustomHyetograph(vector<double>(t,t+4),vector<double>(d,d+4));
}

TEST(SCSCurveNumber, RetentionAndAbstraction)
{
  EXPECT_DOUBLE_EQ(SCSRetention(100.0),0.0);
  EXPECT_NEAR(SCSRetention(50.0),254.0,1e-9);
  EXPECT_NEAR(SCSInitialAbstraction(254.0),50.8,1e-9);
  EXPECT_NEAR(SCSInitialAbstraction(254.0,0.05),12.7,1e-9);
  EXPECT_THROW(SCSRetention(25.0),CPluvialException);
  EXPECT_THROW(SCSInitialAbstraction(254.0,-0.1),CPluvialException);
}

TEST(SCSCurveNumber, RunoffDepth)
{
  double S =25400.0/80.0-254.0;
  double Ia=0.2*S;
  EXPECT_NEAR(SCSRunoff(100.0,80.0),(100.0-Ia)*(100.0-Ia)/(100.0-Ia+S),1e-9);
  EXPECT_DOUBLE_EQ(SCSRunoff(10.0,80.0),0.0)<<"no runoff below initial abstraction";
  EXPECT_NEAR(SCSRunoff(42.0,100.0),42.0,1e-9)<<"impervious basin";
  EXPECT_GT(SCSRunoff(50.0,80.0,0.05),SCSRunoff(50.0,80.0,0.2));
  EXPECT_LT(SCSRunoff(100.0,80.0),100.0);
}

TEST(SCSCurveNumber, AntecedentMoisture)
{
  scs_runoff_result dry=CalculateSCSRunoff(80.0,75.0,AMC_I);
  scs_runoff_result avg=CalculateSCSRunoff(80.0,75.0,AMC_II);
  scs_runoff_result wet=CalculateSCSRunoff(80.0,75.0,AMC_III);
  EXPECT_DOUBLE_EQ(avg.CN_used,75.0);
  EXPECT_LT(dry.runoff_mm,avg.runoff_mm);
  EXPECT_LT(avg.runoff_mm,wet.runoff_mm);
  EXPECT_NEAR(avg.Ia_mm,0.2*avg.S_mm,1e-12);
  EXPECT_THROW(CalculateSCSRunoff(-1.0,75.0),CPluvialException);
}

TEST(SCSCurveNumber, ExcessSeriesSumsToEventRunoff)
{
  hyetograph_result H=TestStorm();
  vector<double> ex=SCSExcessSeries(H.cumulative_mm,85.0);
  ASSERT_EQ(ex.size(),H.depth_mm.size());
  EXPECT_NEAR(VectorSum(ex),SCSRunoff(60.0,85.0),1e-9);
  for (int i=0;i<(int)(ex.size());i++){
    EXPECT_GE(ex[i],0.0);
    EXPECT_LE(ex[i],H.depth_mm[i]+1e-12);
  }
}

TEST(SCSCurveNumber, MinimumInfiltrationRate)
{
  EXPECT_DOUBLE_EQ(GetMinimumInfiltrationRate("A"),2.4);
  EXPECT_DOUBLE_EQ(GetMinimumInfiltrationRate("b"),1.2);
  EXPECT_DOUBLE_EQ(GetMinimumInfiltrationRate("C"),1.2);
  EXPECT_DOUBLE_EQ(GetMinimumInfiltrationRate("D"),1.2);
  EXPECT_THROW(GetMinimumInfiltrationRate("E"),CPluvialException);
  EXPECT_THROW(GetMinimumInfiltrationRate(""),CPluvialException);
}

TEST(RainfallExcess, Rational)
{
  hyetograph_result H=TestStorm();
  excess_result E=RationalExcess(H,0.5);
  ASSERT_TRUE(E.available);
  EXPECT_EQ(E.method,RUNOFF_RATIONAL);
  EXPECT_DOUBLE_EQ(E.runoff_mm,30.0);
  EXPECT_DOUBLE_EQ(E.excess_mm[1],12.5);
  EXPECT_DOUBLE_EQ(E.C_used,0.5);
  EXPECT_THROW(RationalExcess(H,1.2),CPluvialException);
}

TEST(RainfallExcess, SCS)
{
  hyetograph_result H=TestStorm();
  excess_result E=SCSExcess(H,80.0,AMC_III,0.2);
  ASSERT_TRUE(E.available);
  EXPECT_EQ(E.method,RUNOFF_SCS_CN);
  EXPECT_EQ(E.amc,AMC_III);
  EXPECT_GT(E.CN_used,80.0);
  EXPECT_NEAR(E.runoff_mm,SCSRunoff(60.0,E.CN_used),1e-9);
  EXPECT_NEAR(E.Ia_mm,0.2*E.S_mm,1e-12);
}

TEST(RainfallExcess, UnavailableWithoutCoefficient)
{
  hyetograph_result H=TestStorm();
  EXPECT_FALSE(RationalExcess(H,PLV_BLANK_DATA).available);
  EXPECT_FALSE(SCSExcess(H,PLV_BLANK_DATA).available);
  EXPECT_FALSE(CalculateRainfallExcess(RUNOFF_SCS_CN,H,0.5,PLV_BLANK_DATA,AMC_II,0.2).available);
  EXPECT_TRUE (CalculateRainfallExcess(RUNOFF_RATIONAL,H,0.5,PLV_BLANK_DATA,AMC_II,0.2).available);
}

TEST(RainfallExcess, MethodTags)
{
  EXPECT_EQ(StringToRunoffMethod("rational"),RUNOFF_RATIONAL);
  EXPECT_EQ(StringToRunoffMethod("Racional"),RUNOFF_RATIONAL);
  EXPECT_EQ(StringToRunoffMethod("SCS-CN"),RUNOFF_SCS_CN);
  EXPECT_EQ(RunoffMethodToString(RUNOFF_SCS_CN),"scs_cn");
  EXPECT_THROW(StringToRunoffMethod("horton"),CPluvialException);
}

TEST(RationalMethod, FrequencyFactor)
{
  EXPECT_DOUBLE_EQ(RationalFrequencyFactor(2.0),  1.0);
  EXPECT_DOUBLE_EQ(RationalFrequencyFactor(10.0), 1.0);
  EXPECT_DOUBLE_EQ(RationalFrequencyFactor(25.0), 1.1);
  EXPECT_DOUBLE_EQ(RationalFrequencyFactor(50.0), 1.2);
  EXPECT_DOUBLE_EQ(RationalFrequencyFactor(100.0),1.25);
  EXPECT_DOUBLE_EQ(RationalFrequencyFactor(500.0),1.25);
}

TEST(RationalMethod, PeakFlow)
{
  EXPECT_NEAR(RationalPeakFlow(0.5,100.0,10.0),1.39,1e-9);
  EXPECT_NEAR(RationalPeakFlow(0.5,100.0,10.0,50.0),1.39*1.2,1e-9);
  EXPECT_NEAR(RationalPeakFlow(0.9,100.0,10.0,100.0),2.78,1e-9)<<"adjusted C limited to 1";
  EXPECT_THROW(RationalPeakFlow(0.0,100.0,10.0),CPluvialException);
  EXPECT_THROW(RationalPeakFlow(0.5,0.0,10.0),CPluvialException);
  EXPECT_THROW(RationalPeakFlow(0.5,100.0,-1.0),CPluvialException);
}
