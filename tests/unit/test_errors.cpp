#include <set>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/draft_errors.hpp"

using namespace draftline::core::errors;

// A dummy function to simulate a draft lookup failing
Result<std::string> simulate_lookup(bool should_fail) {
    if (should_fail) {
        return make_error(ErrorKind::InvalidDraftId, "Invalid draft_id");
    }
    return std::string("/drafts/abc");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_lookup(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "/drafts/abc");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_lookup(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.kind, ErrorKind::InvalidDraftId);
    EXPECT_EQ(error.message, "Invalid draft_id");
    EXPECT_EQ(error.code, "invalid_draft_id");
    EXPECT_TRUE(error.detail.empty());
}

TEST(ErrorModelTest, EveryKindHasADistinctCode) {
    const ErrorKind kinds[] = {
        ErrorKind::UnknownTool,       ErrorKind::MissingRequiredArgument,
        ErrorKind::InvalidArgument,   ErrorKind::InvalidDraftId,
        ErrorKind::InvalidDraftState, ErrorKind::CompositionBackendError,
        ErrorKind::InternalError,     ErrorKind::Input,
    };
    std::set<std::string> codes;
    for (const auto kind : kinds) {
        codes.insert(to_code(kind));
    }
    EXPECT_EQ(codes.size(), sizeof(kinds) / sizeof(kinds[0]));
    EXPECT_EQ(to_code(ErrorKind::UnknownTool), "unknown_tool");
    EXPECT_EQ(to_code(ErrorKind::CompositionBackendError), "composition_backend_error");
}

TEST(ErrorModelTest, MakeErrorKeepsDetail) {
    auto error = make_error(ErrorKind::CompositionBackendError, "boom", "tool=add_video");
    EXPECT_EQ(error.code, "composition_backend_error");
    EXPECT_EQ(error.detail, "tool=add_video");
}
