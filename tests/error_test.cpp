#include <jsondiff-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace jsondiff_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::malformed_path),  "malformed_path");
    EXPECT_EQ(to_string_view(ErrorKind::wrong_dialect),   "wrong_dialect");
    EXPECT_EQ(to_string_view(ErrorKind::viewer_mismatch), "viewer_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_value),   "invalid_value");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_option),  "invalid_option");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::malformed_path, "unterminated '['"};
    const auto e2 = Error{ErrorKind::malformed_path, "unterminated '['"};
    const auto e3 = Error{ErrorKind::wrong_dialect, "unterminated '['"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::invalid_value, "foo"};
    const auto e2 = Error{ErrorKind::invalid_value, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Exception, path_error_carries_kind_and_message) {
    try {
        throw PathError{ErrorKind::wrong_dialect, "identity segment in IndexPath"};
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::wrong_dialect);
        EXPECT_EQ(e.error().message, "identity segment in IndexPath");
        EXPECT_STREQ(e.what(), "identity segment in IndexPath");
    }
}

TEST(Exception, value_and_options_errors_have_fixed_kinds) {
    EXPECT_EQ(ValueError{"x"}.kind(), ErrorKind::invalid_value);
    EXPECT_EQ(OptionsError{"x"}.kind(), ErrorKind::invalid_option);
}

TEST(Exception, derives_from_runtime_error) {
    EXPECT_THROW(throw OptionsError{"ratio"}, std::runtime_error);
}
