#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/draft_errors.hpp"
#include "protocol/envelope.hpp"

namespace {

using draftline::core::errors::ErrorKind;
using draftline::core::errors::make_error;
using draftline::protocol::EnvelopeOptions;
using draftline::protocol::make_failure;
using draftline::protocol::make_success;
using draftline::protocol::to_envelope;
using nlohmann::json;

TEST(EnvelopeTest, SuccessMergesPayloadBesideFlag) {
    const json envelope =
        to_envelope(make_success(json{{"draft_id", "abc"}, {"width", 1080}}));
    EXPECT_EQ(envelope["success"], true);
    EXPECT_EQ(envelope["draft_id"], "abc");
    EXPECT_EQ(envelope["width"], 1080);
    EXPECT_FALSE(envelope.contains("error"));
}

TEST(EnvelopeTest, PayloadCannotOverrideSuccessFlag) {
    const json envelope = to_envelope(make_success(json{{"success", false}, {"x", 1}}));
    EXPECT_EQ(envelope["success"], true);
    EXPECT_EQ(envelope["x"], 1);
}

TEST(EnvelopeTest, FailureCarriesMessageAndKind) {
    const json envelope =
        to_envelope(make_failure(make_error(ErrorKind::UnknownTool, "Unknown tool: x")));
    EXPECT_EQ(envelope["success"], false);
    EXPECT_EQ(envelope["error"], "Unknown tool: x");
    EXPECT_EQ(envelope["error_kind"], "unknown_tool");
    EXPECT_FALSE(envelope.contains("traceback"));
}

TEST(EnvelopeTest, TracebackFollowsOptions) {
    const auto failure =
        make_failure(make_error(ErrorKind::CompositionBackendError, "boom", "tool=add_video"));

    EXPECT_EQ(to_envelope(failure)["traceback"], "tool=add_video");

    EnvelopeOptions remote;
    remote.include_traceback = false;
    EXPECT_FALSE(to_envelope(failure, remote).contains("traceback"));
}

}  // namespace
