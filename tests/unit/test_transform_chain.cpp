/**
 * @file test_transform_chain.cpp
 * @brief Unit tests for TransformChain
 */

#include <gtest/gtest.h>
#include <linepipe/transform/builtin.hpp>
#include <linepipe/transform/transform_chain.hpp>

#include <memory>

using namespace linepipe::transform;
using linepipe::common::ErrorCode;

namespace {

std::shared_ptr<const ILineTransformer> failing_stage(std::string name) {
    return std::make_shared<CallbackTransformer>(
        [](std::string_view line) -> Result<std::string> {
            if (line.find("bad") != std::string_view::npos) {
                return Result<std::string>(ErrorCode::MALFORMED_LINE, "contains 'bad'");
            }
            return std::string(line);
        },
        std::move(name));
}

}  // namespace

class TransformChainTest : public ::testing::Test {
protected:
    std::shared_ptr<const ILineTransformer> strip_  = std::make_shared<StripTransformer>();
    std::shared_ptr<const ILineTransformer> upper_  = std::make_shared<UpperTransformer>();
    std::shared_ptr<const ILineTransformer> redact_ = std::make_shared<RedactIpTransformer>();
};

TEST_F(TransformChainTest, EmptyChainIsPassthrough) {
    TransformChain chain;
    EXPECT_TRUE(chain.empty());
    EXPECT_EQ(chain.name(), "");
    EXPECT_EQ(chain.transform("  as is \n").value(), "  as is \n");
}

TEST_F(TransformChainTest, AppliesInOrder) {
    TransformChain chain({strip_, upper_});
    EXPECT_EQ(chain.size(), 2u);
    EXPECT_EQ(chain.transform("  mixed Case \n").value(), "MIXED CASE\n");
}

TEST_F(TransformChainTest, NameJoinsStages) {
    TransformChain chain({strip_, redact_});
    EXPECT_EQ(chain.name(), "strip,redact_ip");

    chain.add(upper_);
    EXPECT_EQ(chain.name(), "strip,redact_ip,upper");
}

TEST_F(TransformChainTest, NullStagesSkipped) {
    TransformChain chain({nullptr, upper_});
    EXPECT_EQ(chain.size(), 1u);
    chain.add(nullptr);
    EXPECT_EQ(chain.size(), 1u);
}

TEST_F(TransformChainTest, FailingStageWrapped) {
    TransformChain chain({strip_, failing_stage("reject"), upper_});

    auto ok_line = chain.transform(" fine \n");
    ASSERT_TRUE(ok_line);
    EXPECT_EQ(ok_line.value(), "FINE\n");

    auto result = chain.transform(" bad \n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::STAGE_FAILED);
    EXPECT_EQ(*result.error().context("stage"), "reject");
    ASSERT_NE(result.error().cause(), nullptr);
    EXPECT_EQ(result.error().cause()->code(), ErrorCode::MALFORMED_LINE);
}

TEST_F(TransformChainTest, InvocableOnlyIfAllStagesAre) {
    TransformChain good({strip_, upper_});
    EXPECT_TRUE(good.is_invocable());

    TransformChain bad({strip_, std::make_shared<CallbackTransformer>(nullptr)});
    EXPECT_FALSE(bad.is_invocable());
}

TEST_F(TransformChainTest, DescriptionMentionsStages) {
    TransformChain chain({strip_, upper_});
    EXPECT_NE(chain.description().find(strip_->description()), std::string::npos);
    EXPECT_NE(chain.description().find(upper_->description()), std::string::npos);
}
