#include <gtest/gtest.h>
#include <stdexcept>
#include "atl_types.hpp"
#include "errors.hpp"
#include "json_codec.hpp"

using namespace atl;

TEST(TypesTest, KindNamesParseBack) {
    for (SubjectKind kind : {SubjectKind::UserProfile, SubjectKind::Post, SubjectKind::ConnectionRequest,
                             SubjectKind::TopupRequest}) {
        EXPECT_EQ(kind, kind_from_string(to_string(kind)));
    }
    EXPECT_EQ(LedgerReason::Refund, reason_from_string("REFUND"));
    EXPECT_EQ(SubjectStatus::Cancelled, status_from_string("CANCELLED"));
    EXPECT_EQ(Role::Admin, role_from_string("ADMIN"));
}

TEST(TypesTest, UnknownNamesThrow) {
    EXPECT_THROW(kind_from_string("INVOICE"), std::invalid_argument);
    EXPECT_THROW(reason_from_string("GIFT"), std::invalid_argument);
    EXPECT_THROW(status_from_string("pending"), std::invalid_argument);
}

TEST(TypesTest, DetailsAlternativeMatchesKind) {
    ModeratedSubject subject;
    subject.details = details_for(SubjectKind::ConnectionRequest);
    EXPECT_EQ(SubjectKind::ConnectionRequest, subject.kind());
    subject.details = TopupDetails{};
    EXPECT_EQ(SubjectKind::TopupRequest, subject.kind());
    EXPECT_STREQ("coin_topups", entity_name(SubjectKind::TopupRequest));
}

TEST(ErrorsTest, EveryFailureCodeHasUserText) {
    for (ErrorCode code : {ErrorCode::InsufficientBalance, ErrorCode::NotEligible, ErrorCode::InvalidTarget,
                           ErrorCode::InvalidDelta, ErrorCode::NotFound, ErrorCode::AlreadyDecided,
                           ErrorCode::NotOwner, ErrorCode::DomainEffectFailed, ErrorCode::RefundError,
                           ErrorCode::StoreBusy, ErrorCode::IntegrityViolation, ErrorCode::Forbidden}) {
        EXPECT_FALSE(reason_text(code).empty()) << to_string(code);
    }
    EXPECT_TRUE(is_integrity_fault(ErrorCode::RefundError));
    EXPECT_FALSE(is_integrity_fault(ErrorCode::InsufficientBalance));
    EXPECT_TRUE(is_retryable(ErrorCode::StoreBusy));
}

TEST(ErrorsTest, GuardedTurnsExceptionsIntoOutcomes) {
    Outcome busy = guarded("op", []() -> Outcome { throw TransientFailure("locked"); });
    EXPECT_FALSE(busy.ok);
    EXPECT_EQ(ErrorCode::StoreBusy, busy.code);

    Outcome broken = guarded("op", []() -> Outcome { throw std::runtime_error("connection reset"); });
    EXPECT_EQ(ErrorCode::StoreBusy, broken.code);

    Outcome integrity = guarded("op", []() -> Outcome {
        throw IntegrityFault(ErrorCode::RefundError, "double refund");
    });
    EXPECT_EQ(ErrorCode::RefundError, integrity.code);
    EXPECT_EQ(reason_text(ErrorCode::RefundError), integrity.message);
}

TEST(JsonCodecTest, SubjectCarriesDetails) {
    ModeratedSubject subject;
    subject.id = 7;
    subject.owner_account_id = 3;
    subject.coin_cost = 5;
    ConnectionDetails connection;
    connection.target_account_id = 9;
    subject.details = connection;

    json j = subject;
    EXPECT_EQ("CONNECTION_REQUEST", j["kind"]);
    EXPECT_EQ(9, j["details"]["targetUserId"]);
    EXPECT_TRUE(j["details"]["postId"].is_null());
    EXPECT_TRUE(j["decidedBy"].is_null());

    SubjectDetails parsed = details_from_json(SubjectKind::ConnectionRequest, j["details"]);
    EXPECT_EQ(9, std::get<ConnectionDetails>(parsed).target_account_id);
    EXPECT_FALSE(std::get<ConnectionDetails>(parsed).post_id.has_value());
}

TEST(JsonCodecTest, MissingDetailFieldThrows) {
    EXPECT_THROW(details_from_json(SubjectKind::TopupRequest, json::object()), json::exception);
}
