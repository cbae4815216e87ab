/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include <cstdio>
#include "PluvialMain.h"

class ParseInputTest : public ::testing::Test
{
protected:
  optStruct        Options;
  basin_params     basin;
  analysis_options AO;
  vector<string>   written;

  void SetUp()
  {
    Options.silent=true;
    Options.noisy =false;
    Options.pause =false;
    Options.rvs_filename="pluvial_parse_test.rvs";
  }
  void TearDown()
  {
    for (int i=0;i<(int)(written.size());i++){remove(written[i].c_str());}
  }
  void WriteFile(const string filename, const string contents)
  {
    ofstream OUT(filename.c_str());
    OUT<<contents;
    OUT.close();
    written.push_back(filename);
  }
};

TEST_F(ParseInputTest, FullBasinFile)
{
  WriteFile(Options.rvs_filename,
    "# test basin\n"
    ":FileType rvs Pluvial 1.0\n"
    ":BasinName Arroyo Carrasco\n"
    ":Area          45.0\n"
    ":Slope         2.5\n"
    ":ChannelLength 1200\n"
    ":ElevationDrop 18\n"
    ":P3_10         83\n"
    ":RunoffCoefficient 0.55\n"
    ":CurveNumber   78\n"
    ":TcMethods     kirpich NRCS desbordes\n"
    ":InletTime     8\n"
    ":NRCSSegments\n"
    "  :SheetFlow   50  0.15 0.02\n"
    "  # shallow flow over pavement\n"
    "  :ShallowFlow 300 0.02 paved\n"
    "  :ChannelFlow 800 0.04 0.005 0.5\n"
    ":EndNRCSSegments\n"
    ":StormCodes    gz blocks24 huff_q3\n"
    ":ReturnPeriods 2, 10, 25, 100\n"
    ":XFactors      1.0 1.25\n"
    ":TimeStep      10\n"
    ":AMC           III\n"
    ":Lambda        0.05\n"
    ":RunoffMethods scs-cn\n");

  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  EXPECT_EQ(basin.name,"Arroyo Carrasco");
  EXPECT_DOUBLE_EQ(basin.area_ha,45.0);
  EXPECT_DOUBLE_EQ(basin.slope_pct,2.5);
  EXPECT_DOUBLE_EQ(basin.length_m,1200.0);
  EXPECT_DOUBLE_EQ(basin.elevation_drop_m,18.0);
  EXPECT_DOUBLE_EQ(basin.P3_10,83.0);
  EXPECT_DOUBLE_EQ(basin.C,0.55);
  EXPECT_DOUBLE_EQ(basin.CN,78.0);

  ASSERT_EQ((int)(AO.tc_methods.size()),3);
  EXPECT_EQ(AO.tc_methods[1],"nrcs");
  EXPECT_DOUBLE_EQ(AO.tc.t0_min,8.0);
  EXPECT_TRUE(AO.tc.has_segments);
  ASSERT_EQ((int)(AO.tc.segments.size()),3);
  EXPECT_EQ(AO.tc.segments[0].type,SEGMENT_SHEET);
  EXPECT_EQ(AO.tc.segments[1].surface,SURFACE_PAVED);
  EXPECT_DOUBLE_EQ(AO.tc.segments[2].hyd_radius_m,0.5);

  ASSERT_EQ((int)(AO.storm_codes.size()),3);
  EXPECT_EQ(AO.storm_codes[0],"gz");
  EXPECT_EQ(AO.storm_codes[2],"huff_q3");
  ASSERT_EQ((int)(AO.return_periods.size()),4);
  EXPECT_DOUBLE_EQ(AO.return_periods[3],100.0);
  ASSERT_EQ((int)(AO.x_factors.size()),2);
  EXPECT_DOUBLE_EQ(AO.x_factors[1],1.25);
  EXPECT_DOUBLE_EQ(AO.dt_min,10.0);
  EXPECT_EQ(AO.amc,AMC_III);
  EXPECT_DOUBLE_EQ(AO.lambda,0.05);
  ASSERT_EQ((int)(AO.runoff_methods.size()),1);
  EXPECT_EQ(AO.runoff_methods[0],"scs_cn");
}

TEST_F(ParseInputTest, DefaultsKeptWhenNotSpecified)
{
  WriteFile(Options.rvs_filename,":Area 12\n:RunoffCoefficient 0.4\n:P3_10 80\n");
  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  analysis_options defaults;
  EXPECT_EQ(AO.tc_methods,defaults.tc_methods);
  EXPECT_EQ(AO.storm_codes,defaults.storm_codes);
  EXPECT_EQ(AO.return_periods,defaults.return_periods);
  EXPECT_DOUBLE_EQ(AO.dt_min,5.0);
  EXPECT_EQ(AO.amc,AMC_II);
  EXPECT_FALSE(AO.tc.has_segments);
}

TEST_F(ParseInputTest, RepeatedListCommandsAccumulate)
{
  WriteFile(Options.rvs_filename,":Area 12\n:CurveNumber 70\n:ReturnPeriods 5\n:ReturnPeriods 50\n");
  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  ASSERT_EQ((int)(AO.return_periods.size()),2);
  EXPECT_DOUBLE_EQ(AO.return_periods[0],5.0);
  EXPECT_DOUBLE_EQ(AO.return_periods[1],50.0);
}

TEST_F(ParseInputTest, CoverageWeighting)
{
  WriteFile(Options.rvs_filename,
    ":Area 10\n"
    ":CoverageTable chow\n"
    ":Coverage 5 2\n"
    ":Coverage 5 =0.75\n"
    ":SoilGroup a\n"
    ":CNCoverage 4 0\n"
    ":CNCoverage 4 =61\n");
  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  ASSERT_EQ((int)(basin.c_coverage.size()),2);
  EXPECT_EQ(basin.c_coverage[0].source,COVERAGE_FROM_TABLE);
  EXPECT_EQ(basin.c_coverage[1].source,COVERAGE_OPAQUE);
  EXPECT_NEAR(basin.C,(0.25+0.75)/2.0,1e-9)<<"area-weighted C at Tr=2";
  EXPECT_EQ(basin.soil_group,"A");
  EXPECT_NEAR(basin.CN,(77.0+61.0)/2.0,1e-9);
}

TEST_F(ParseInputTest, ExplicitCoefficientOverridesCoverage)
{
  WriteFile(Options.rvs_filename,":Area 10\n:RunoffCoefficient 0.6\n:Coverage 10 2\n");
  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  EXPECT_DOUBLE_EQ(basin.C,0.6);
  EXPECT_EQ((int)(basin.c_coverage.size()),1);
}

TEST_F(ParseInputTest, DepartmentSetsP3_10)
{
  WriteFile(Options.rvs_filename,":Area 10\n:RunoffCoefficient 0.5\n:Department Treinta y Tres\n");
  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  EXPECT_DOUBLE_EQ(basin.P3_10,80.0);
}

TEST_F(ParseInputTest, CustomHyetographBlock)
{
  WriteFile(Options.rvs_filename,
    ":Area 10\n:RunoffCoefficient 0.5\n:StormCodes custom\n"
    ":CustomHyetograph\n"
    "  10  2.0\n"
    "  20  6.5\n"
    "  30  1.5\n"
    ":EndCustomHyetograph\n"
    ":CustomDuration 0.5\n");
  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  ASSERT_EQ((int)(AO.storm.custom_time_min.size()),3);
  EXPECT_DOUBLE_EQ(AO.storm.custom_time_min[2],30.0);
  EXPECT_DOUBLE_EQ(AO.storm.custom_depth_series[1],6.5);
  EXPECT_DOUBLE_EQ(AO.storm.custom_duration_hr,0.5);
}

TEST_F(ParseInputTest, UnterminatedBlockRaises)
{
  WriteFile(Options.rvs_filename,":Area 10\n:RunoffCoefficient 0.5\n:CustomHyetograph\n10 2.0\n");
  EXPECT_THROW(ParseAnalysisFile(basin,AO,Options),CPluvialException);
}

TEST_F(ParseInputTest, UnknownCommandIsTolerated)
{
  WriteFile(Options.rvs_filename,":Area 10\n:RunoffCoefficient 0.5\n:FutureCommand 12 13\n:Slope 3\n");
  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  EXPECT_DOUBLE_EQ(basin.slope_pct,3.0)<<"parsing continues past unrecognized command";
}

TEST_F(ParseInputTest, EndStopsParsing)
{
  WriteFile(Options.rvs_filename,":Area 10\n:RunoffCoefficient 0.5\n:End\n:Slope 3\n");
  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  EXPECT_DOUBLE_EQ(basin.slope_pct,PLV_BLANK_DATA);
}

TEST_F(ParseInputTest, RedirectToSecondaryFile)
{
  WriteFile("pluvial_parse_test_methods.rvs",":TcMethods temez\n:ReturnPeriods 50\n");
  WriteFile(Options.rvs_filename,":Area 10\n:RedirectToFile pluvial_parse_test_methods.rvs\n:CurveNumber 72\n");
  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  ASSERT_EQ((int)(AO.tc_methods.size()),1);
  EXPECT_EQ(AO.tc_methods[0],"temez");
  EXPECT_DOUBLE_EQ(AO.return_periods[0],50.0);
  EXPECT_DOUBLE_EQ(basin.CN,72.0)<<"parsing resumes in main file after redirect";
}

TEST_F(ParseInputTest, InvalidValuesRaise)
{
  WriteFile(Options.rvs_filename,":Area 10\n:RunoffCoefficient 1.5\n");
  EXPECT_THROW(ParseAnalysisFile(basin,AO,Options),CPluvialException);

  WriteFile(Options.rvs_filename,":Area 10\n:CurveNumber 20\n");
  EXPECT_THROW(ParseAnalysisFile(basin,AO,Options),CPluvialException);

  WriteFile(Options.rvs_filename,":Area 10\n:RunoffCoefficient 0.5\n:XFactors 0.5\n");
  EXPECT_THROW(ParseAnalysisFile(basin,AO,Options),CPluvialException);

  WriteFile(Options.rvs_filename,":Area 10\n:RunoffCoefficient 0.5\n:StormCodes typhoon\n");
  EXPECT_THROW(ParseAnalysisFile(basin,AO,Options),CPluvialException);
}

TEST_F(ParseInputTest, RequiredDescriptors)
{
  WriteFile(Options.rvs_filename,":RunoffCoefficient 0.5\n");
  EXPECT_THROW(ParseAnalysisFile(basin,AO,Options),CPluvialException)<<"area is required";

  basin_params b2;
  WriteFile(Options.rvs_filename,":Area 10\n:Slope 2\n");
  EXPECT_THROW(ParseAnalysisFile(b2,AO,Options),CPluvialException)<<"C or CN is required";
}

TEST_F(ParseInputTest, MissingFile)
{
  Options.rvs_filename="pluvial_no_such_file.rvs";
  EXPECT_FALSE(ParseAnalysisFile(basin,AO,Options));
}

TEST_F(ParseInputTest, UnitHydrographCommands)
{
  WriteFile(Options.rvs_filename,
    ":Area 10\n:CurveNumber 70\n"
    ":UnitHydrograph Snyder\n"
    ":PeakRateFactor 300\n"
    ":GammaShape 4.5\n"
    ":SnyderCoefficients 1.8 0.7\n"
    ":CentroidDistance 0.4\n"
    ":ClarkStorage 0.75\n");
  ASSERT_TRUE(ParseAnalysisFile(basin,AO,Options));
  EXPECT_EQ(AO.uh_tag,"snyder");
  EXPECT_DOUBLE_EQ(AO.uh.prf,300.0);
  EXPECT_DOUBLE_EQ(AO.uh.gamma_m,4.5);
  EXPECT_DOUBLE_EQ(AO.uh.Ct,1.8);
  EXPECT_DOUBLE_EQ(AO.uh.Cp,0.7);
  EXPECT_DOUBLE_EQ(AO.uh.lc_km,0.4);
  EXPECT_DOUBLE_EQ(AO.uh.R_hr,0.75);

  WriteFile(Options.rvs_filename,":Area 10\n:CurveNumber 70\n:UnitHydrograph nash\n");
  EXPECT_THROW(ParseAnalysisFile(basin,AO,Options),CPluvialException);

  WriteFile(Options.rvs_filename,":Area 10\n:CurveNumber 70\n:ClarkStorage -1\n");
  EXPECT_THROW(ParseAnalysisFile(basin,AO,Options),CPluvialException);
}
