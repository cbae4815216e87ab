/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include <cstdio>
#include "AnalysisRun.h"

class AnalysisRunnerTest : public ::testing::Test
{
protected:
  static CDistributionRegistry *pRegistry;
  basin_params     basin;
  analysis_options AO;

  static void SetUpTestCase()   {pRegistry=new CDistributionRegistry(PLUVIAL_DATA_DIR);}
  static void TearDownTestCase(){delete pRegistry;pRegistry=NULL;}

  void SetUp()
  {
    basin.name     ="test basin";
    basin.area_ha  =50.0;
    basin.slope_pct=2.0;
    basin.length_m =1000.0;
    basin.P3_10    =83.0;
    basin.C        =0.5;
  }
};
CDistributionRegistry *AnalysisRunnerTest::pRegistry=NULL;

TEST_F(AnalysisRunnerTest, DefaultCombinations)
{
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  EXPECT_EQ(Runner.GetNumTcResults(),2);
  EXPECT_EQ(Runner.GetNumRuns(),6)<<"two Tc methods, one storm, three return periods, rational only";
  EXPECT_EQ(Runner.GetNumSkipped(),0);

  const analysis_run &first=Runner.GetRun(0);
  EXPECT_EQ(first.hydrograph.tc_method,"kirpich");
  EXPECT_EQ(first.hydrograph.storm_code,"gz");
  EXPECT_DOUBLE_EQ(first.hydrograph.return_period,2.0);
  EXPECT_EQ(first.runoff,RUNOFF_RATIONAL);
  EXPECT_DOUBLE_EQ(first.duration_hr,6.0);
  EXPECT_DOUBLE_EQ(first.C_used,0.5);
  EXPECT_GT(first.hydrograph.peak_flow_m3s,0.0);
  EXPECT_NEAR(first.hydrograph.tc_min,TcKirpich(1000.0,0.02)*MIN_PER_HR,1e-9);
}

TEST_F(AnalysisRunnerTest, PeakIncreasesWithReturnPeriod)
{
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  ASSERT_EQ(Runner.GetNumRuns(),6);
  EXPECT_LT(Runner.GetRun(0).hydrograph.peak_flow_m3s,Runner.GetRun(1).hydrograph.peak_flow_m3s);
  EXPECT_LT(Runner.GetRun(1).hydrograph.peak_flow_m3s,Runner.GetRun(2).hydrograph.peak_flow_m3s);
  EXPECT_GT(Runner.GetRun(2).C_used,Runner.GetRun(0).C_used)<<"C adjusted for return period";
}

TEST_F(AnalysisRunnerTest, DesbordesUsesAdjustedCoefficient)
{
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  const analysis_run &r2 =Runner.GetRun(3);
  const analysis_run &r25=Runner.GetRun(5);
  ASSERT_EQ(r2.tc.method,TC_DESBORDES);
  ASSERT_EQ(r25.tc.method,TC_DESBORDES);
  EXPECT_NEAR(r2.tc.tc_hr,TcDesbordes(50.0,2.0,0.5),1e-9);
  EXPECT_LT(r25.tc.tc_hr,r2.tc.tc_hr)<<"larger C gives shorter Desbordes Tc";
  EXPECT_NEAR(r25.tc.params.at("c"),r25.C_used,1e-12);
}

TEST_F(AnalysisRunnerTest, BothRunoffMethodsWhenAvailable)
{
  basin.CN=75.0;
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  EXPECT_EQ(Runner.GetNumRuns(),12);
  EXPECT_EQ(Runner.GetRun(0).runoff,RUNOFF_RATIONAL);
  EXPECT_EQ(Runner.GetRun(1).runoff,RUNOFF_SCS_CN);
  EXPECT_DOUBLE_EQ(Runner.GetRun(1).CN_used,75.0);
  EXPECT_DOUBLE_EQ(Runner.GetRun(1).C_used,PLV_BLANK_DATA);
}

TEST_F(AnalysisRunnerTest, UnavailableMethodIsSkipped)
{
  AO.runoff_methods.push_back("scs_cn");
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  EXPECT_EQ(Runner.GetNumRuns(),0);
  EXPECT_EQ(Runner.GetNumSkipped(),6);
  EXPECT_EQ(Runner.GetMaxPeakRunIndex(),DOESNT_EXIST);
}

TEST_F(AnalysisRunnerTest, XFactorsOnlyMultiplyGZStorms)
{
  AO.storm_codes.push_back("blocks");
  AO.x_factors.clear();
  AO.x_factors.push_back(1.0);
  AO.x_factors.push_back(2.0);
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  EXPECT_EQ(Runner.GetNumRuns(),2*(3*2+3*1));

  EXPECT_DOUBLE_EQ(Runner.GetRun(0).hydrograph.x_factor,1.0);
  EXPECT_DOUBLE_EQ(Runner.GetRun(1).hydrograph.x_factor,2.0);
  EXPECT_GT(Runner.GetRun(0).hydrograph.peak_flow_m3s,Runner.GetRun(1).hydrograph.peak_flow_m3s);
  for (int i=0;i<Runner.GetNumRuns();i++){
    if (Runner.GetRun(i).hydrograph.storm_code=="blocks"){
      EXPECT_DOUBLE_EQ(Runner.GetRun(i).hydrograph.x_factor,1.0);
    }
  }
}

TEST_F(AnalysisRunnerTest, TcMethodWithMissingInputsIsDropped)
{
  AO.tc_methods.clear();
  AO.tc_methods.push_back("kirpich");
  AO.tc_methods.push_back("california");
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  EXPECT_EQ(Runner.GetNumTcResults(),1);
  EXPECT_EQ(Runner.GetNumRuns(),3);
}

TEST_F(AnalysisRunnerTest, MaxPeakIndex)
{
  AO.storm_codes.push_back("blocks");
  AO.storm_codes.push_back("bimodal");
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  int imax=Runner.GetMaxPeakRunIndex();
  ASSERT_NE(imax,DOESNT_EXIST);
  for (int i=0;i<Runner.GetNumRuns();i++){
    EXPECT_LE(Runner.GetRun(i).hydrograph.peak_flow_m3s,Runner.GetRun(imax).hydrograph.peak_flow_m3s);
  }
}

TEST_F(AnalysisRunnerTest, ConstructorValidation)
{
  basin_params nobasin;
  EXPECT_THROW({CAnalysisRunner R(nobasin,AO,*pRegistry);},CPluvialException);

  analysis_options bad;
  bad.storm_codes.push_back("monsoon");
  EXPECT_THROW({CAnalysisRunner R(basin,bad,*pRegistry);},CPluvialException);

  analysis_options noTr;
  noTr.return_periods.clear();
  EXPECT_THROW({CAnalysisRunner R(basin,noTr,*pRegistry);},CPluvialException);
}

TEST_F(AnalysisRunnerTest, JSONRecord)
{
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  nlohmann::json J=AnalysisRunToJSON(Runner.GetRun(1));
  EXPECT_EQ(J["tc_method"].get<string>(),"kirpich");
  EXPECT_EQ(J["storm_code"].get<string>(),"gz");
  EXPECT_EQ(J["runoff_method"].get<string>(),"rational");
  EXPECT_DOUBLE_EQ(J["return_period"].get<double>(),10.0);
  EXPECT_TRUE(J["cn"].is_null());
  EXPECT_FALSE(J["c"].is_null());
  EXPECT_TRUE(J.contains("tc_length_m"));
  EXPECT_DOUBLE_EQ(J["peak_flow_m3s"].get<double>(),Runner.GetRun(1).hydrograph.peak_flow_m3s);
  EXPECT_EQ(J["flow_m3s"].size(),Runner.GetRun(1).hydrograph.flow_m3s.size());
}

TEST_F(AnalysisRunnerTest, SummaryCSV)
{
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  string filename="pluvial_test_summary.csv";
  WriteSummaryCSV(filename,Runner);

  ifstream IN(filename.c_str());
  ASSERT_FALSE(IN.fail());
  string line;
  int nLines=0;
  getline(IN,line);
  EXPECT_EQ(line.substr(0,17),"tc_method,tc_min,");
  while (getline(IN,line)){if (!line.empty()){nLines++;}}
  IN.close();
  remove(filename.c_str());
  EXPECT_EQ(nLines,Runner.GetNumRuns());
}

TEST_F(AnalysisRunnerTest, HydrographVolumeMatchesRunoffDepth)
{
  basin.CN=75.0;
  AO.storm_codes.clear();
  AO.storm_codes.push_back("gz");
  AO.storm_codes.push_back("blocks");
  CAnalysisRunner Runner(basin,AO,*pRegistry);
  Runner.Run();
  ASSERT_GT(Runner.GetNumRuns(),0);

  bool rational=false,scs=false;
  for (int i=0;i<Runner.GetNumRuns();i++)
  {
    const analysis_run &run=Runner.GetRun(i);
    const hydrograph_result &HG=run.hydrograph;
    double expected=HG.runoff_mm*basin.area_ha*10.0; //1 mm over 1 ha is 10 m3
    EXPECT_NEAR(HG.volume_m3,expected,1e-6*max(expected,1.0))<<HG.tc_method<<" "<<HG.storm_code<<" Tr="<<HG.return_period;
    if (run.runoff==RUNOFF_RATIONAL){rational=true;}
    if (run.runoff==RUNOFF_SCS_CN)  {scs=true;}
    if ((run.runoff==RUNOFF_SCS_CN) && (HG.storm_code=="blocks")){
      EXPECT_EQ(HG.uh_tag,"scs_triangular");
    }
  }
  EXPECT_TRUE(rational);
  EXPECT_TRUE(scs);
}

TEST_F(AnalysisRunnerTest, SelectedUnitHydrograph)
{
  basin.CN=75.0;
  AO.storm_codes.clear();
  AO.storm_codes.push_back("blocks");
  AO.runoff_methods.push_back("scs_cn");

  const char *tags[3]={"scs_curvilinear","clark","gamma"};
  for (int k=0;k<3;k++)
  {
    AO.uh_tag=tags[k];
    CAnalysisRunner Runner(basin,AO,*pRegistry);
    Runner.Run();
    ASSERT_EQ(Runner.GetNumRuns(),6)<<tags[k];
    for (int i=0;i<Runner.GetNumRuns();i++){
      const hydrograph_result &HG=Runner.GetRun(i).hydrograph;
      EXPECT_EQ(HG.uh_tag,tags[k]);
      EXPECT_NEAR(HG.volume_m3,HG.runoff_mm*basin.area_ha*10.0,1e-6*max(HG.volume_m3,1.0));
    }
    nlohmann::json J=AnalysisRunToJSON(Runner.GetRun(0));
    EXPECT_EQ(J["uh_method"].get<string>(),tags[k]);
  }

  AO.uh_tag="nash";
  EXPECT_THROW({CAnalysisRunner R(basin,AO,*pRegistry);},CPluvialException);
}
