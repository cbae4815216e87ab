/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "StormDesign.h"

class StormDesignTest : public ::testing::Test
{
protected:
  static CDistributionRegistry *pRegistry;
  storm_params SP;

  static void SetUpTestCase()   {pRegistry=new CDistributionRegistry(PLUVIAL_DATA_DIR);}
  static void TearDownTestCase(){delete pRegistry;pRegistry=NULL;}
};
CDistributionRegistry *StormDesignTest::pRegistry=NULL;

TEST(StormCodes, Tags)
{
  EXPECT_EQ(StringToStormCode("GZ"),STORM_GZ);
  EXPECT_EQ(StringToStormCode("blocks"),STORM_BLOCKS);
  EXPECT_EQ(StringToStormCode("blocks24"),STORM_BLOCKS24);
  EXPECT_EQ(StringToStormCode("scs_ii"),STORM_SCS_II);
  EXPECT_EQ(StringToStormCode("huff_q3"),STORM_HUFF);
  EXPECT_EQ(StringToStormCode("bimodal"),STORM_BIMODAL);
  EXPECT_EQ(StringToStormCode("custom"),STORM_CUSTOM);
  EXPECT_EQ(StormCodeToString(STORM_BLOCKS24),"blocks24");
  EXPECT_THROW(StringToStormCode("chicago"),CPluvialException);
}

TEST(StormCodes, HuffQuartileParsing)
{
  EXPECT_EQ(GetHuffQuartileFromCode("huff_q1"),1);
  EXPECT_EQ(GetHuffQuartileFromCode("HUFF_Q4"),4);
  EXPECT_EQ(GetHuffQuartileFromCode("huff"),2)<<"second quartile by default";
  EXPECT_THROW(GetHuffQuartileFromCode("huff_q7"),CPluvialException);
  EXPECT_THROW(GetHuffQuartileFromCode("huff_qx"),CPluvialException);
  EXPECT_THROW(StringToStormCode("huff_q0"),CPluvialException);
  EXPECT_THROW(GetHuffQuartileFromCode("huffy"),CPluvialException);
  EXPECT_THROW(GetHuffQuartileFromCode("huff_q2.5"),CPluvialException);
  EXPECT_THROW(GetHuffQuartileFromCode("huff_q"),CPluvialException);
  EXPECT_THROW(GetHuffQuartileFromCode("huff_q12"),CPluvialException);
  EXPECT_THROW(StringToStormCode("huffy"),CPluvialException);
}

TEST(StormCodes, DurationAndTimeStepPolicy)
{
  storm_params SP;
  SP.bimodal_duration_hr=8.0;
  SP.custom_duration_hr =3.0;
  double D,dt;

  GetStormDurationAndDt("gz",0.4,5.0,SP,D,dt);
  EXPECT_DOUBLE_EQ(D,6.0);  EXPECT_DOUBLE_EQ(dt,5.0);

  GetStormDurationAndDt("blocks",0.5,5.0,SP,D,dt);
  EXPECT_DOUBLE_EQ(D,1.0)<<"blocks storm lasts at least one hour";
  GetStormDurationAndDt("blocks",1.5,5.0,SP,D,dt);
  EXPECT_DOUBLE_EQ(D,1.5);

  GetStormDurationAndDt("blocks24",0.5,5.0,SP,D,dt);
  EXPECT_DOUBLE_EQ(D,24.0); EXPECT_DOUBLE_EQ(dt,10.0);
  GetStormDurationAndDt("scs_ii",0.5,15.0,SP,D,dt);
  EXPECT_DOUBLE_EQ(D,24.0); EXPECT_DOUBLE_EQ(dt,15.0);

  GetStormDurationAndDt("huff_q2",0.5,5.0,SP,D,dt);
  EXPECT_DOUBLE_EQ(D,2.0);
  GetStormDurationAndDt("huff_q2",2.0,5.0,SP,D,dt);
  EXPECT_DOUBLE_EQ(D,4.0);

  GetStormDurationAndDt("bimodal",0.5,5.0,SP,D,dt);
  EXPECT_DOUBLE_EQ(D,8.0);
  GetStormDurationAndDt("custom",0.5,5.0,SP,D,dt);
  EXPECT_DOUBLE_EQ(D,3.0);
}

TEST_F(StormDesignTest, GZPeaksEarly)
{
  hyetograph_result H=GenerateDesignStorm("gz",83.0,10.0,6.0,5.0,SP,*pRegistry);
  EXPECT_EQ((int)(H.depth_mm.size()),72);
  EXPECT_EQ(VectorArgMax(H.depth_mm),12);
  EXPECT_NEAR(H.total_depth_mm,DinaguaDepth(83.0,10.0,6.0),1e-9);
}

TEST_F(StormDesignTest, TotalsFollowDinagua)
{
  hyetograph_result S=GenerateDesignStorm("scs_ii",83.0,25.0,24.0,10.0,SP,*pRegistry);
  EXPECT_EQ((int)(S.depth_mm.size()),144);
  EXPECT_NEAR(S.total_depth_mm,DinaguaDepth(83.0,25.0,24.0),1e-9);
  EXPECT_EQ(S.method,"scs_type_ii");

  hyetograph_result Q=GenerateDesignStorm("huff_q1",83.0,25.0,2.0,5.0,SP,*pRegistry);
  EXPECT_NEAR(Q.total_depth_mm,DinaguaDepth(83.0,25.0,2.0),1e-9);
  EXPECT_EQ(Q.method,"huff_q1_p50");

  hyetograph_result B=GenerateDesignStorm("bimodal",83.0,25.0,6.0,5.0,SP,*pRegistry);
  EXPECT_NEAR(B.total_depth_mm,DinaguaDepth(83.0,25.0,6.0),1e-9);
}

TEST_F(StormDesignTest, CustomStormSources)
{
  hyetograph_result H=GenerateDesignStorm("custom",83.0,10.0,6.0,10.0,SP,*pRegistry);
  EXPECT_EQ(H.method,"alternating_blocks_dinagua")<<"custom storm falls back to DINAGUA blocks";

  SP.custom_depth_mm=40.0;
  SP.custom_distribution="uniform";
  H=GenerateDesignStorm("custom",83.0,10.0,2.0,10.0,SP,*pRegistry);
  EXPECT_EQ(H.method,"custom_uniform");
  EXPECT_NEAR(H.total_depth_mm,40.0,1e-9);

  SP.custom_distribution="alternating_blocks_gz";
  H=GenerateDesignStorm("custom",83.0,10.0,6.0,10.0,SP,*pRegistry);
  EXPECT_EQ(VectorArgMax(H.depth_mm),6);

  SP.custom_time_min.push_back(10.0);  SP.custom_depth_series.push_back(2.0);
  SP.custom_time_min.push_back(20.0);  SP.custom_depth_series.push_back(6.0);
  SP.custom_time_min.push_back(30.0);  SP.custom_depth_series.push_back(1.0);
  H=GenerateDesignStorm("custom",83.0,10.0,6.0,10.0,SP,*pRegistry);
  EXPECT_EQ(H.method,"custom_event")<<"observed series takes precedence over depth";
  EXPECT_DOUBLE_EQ(H.total_depth_mm,9.0);
}
