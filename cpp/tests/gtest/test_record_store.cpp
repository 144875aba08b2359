// =============================================================================
// Record Store Tests
// =============================================================================

#include <gtest/gtest.h>
#include <boost/json.hpp>
#include <cctype>

#include "shortkey/error.hpp"
#include "shortkey/fingerprint.hpp"
#include "shortkey/record_store.hpp"
#include "test_support.hpp"

using namespace shortkey;
using namespace shortkey::test_support;

class RecordStoreTest : public ::testing::Test {
protected:
    MemoryBackend backend;
    RecordStore store{backend, FingerprintConfig{}};

    AllocationRecord commit(uint64_t n, const std::string& identifier) {
        IdentifierCandidate candidate{identifier, static_cast<int>(identifier.size()), "00ff"};
        return store.commit_new(make_request(n), candidate, AssignAudit{1, 0, 0});
    }

    static std::string text_field(const OperationLogEntry& entry, const char* key) {
        boost::json::value v = boost::json::parse(entry.details);
        return std::string(v.as_object().at(key).as_string().c_str());
    }

    static int64_t int_field(const OperationLogEntry& entry, const char* key) {
        boost::json::value v = boost::json::parse(entry.details);
        return v.as_object().at(key).as_int64();
    }
};

TEST_F(RecordStoreTest, CommitNewBindsIdentifierAndLogsAssign) {
    AllocationRecord rec = commit(1, "aB3x");

    ASSERT_TRUE(rec.has_identifier());
    EXPECT_EQ(*rec.identifier, "aB3x");
    EXPECT_EQ(rec.identifier_length, 4);
    EXPECT_EQ(rec.generation_salt, "00ff");
    EXPECT_EQ(rec.status, RecordStatus::Active);
    EXPECT_EQ(rec.content_uuid, to_content_uuid(make_fingerprint(1)));
    EXPECT_TRUE(rec.identifier_assigned_at.has_value());

    auto ops = store.operations_for(rec.id);
    ASSERT_EQ(ops.size(), 1u);
    EXPECT_EQ(ops[0].kind, OperationKind::Assign);
    EXPECT_EQ(text_field(ops[0], "identifier"), "aB3x");
    EXPECT_EQ(int_field(ops[0], "length"), 4);
    EXPECT_EQ(int_field(ops[0], "attempts"), 1);
}

TEST_F(RecordStoreTest, CommitNewReportsWhichKeyConflicted) {
    commit(1, "aB3x");

    try {
        commit(2, "aB3x");
        FAIL() << "expected identifier conflict";
    } catch (const UniqueConflictError& e) {
        EXPECT_EQ(e.kind(), ConflictKind::Identifier);
    }

    try {
        commit(1, "zzzz");
        FAIL() << "expected fingerprint conflict";
    } catch (const UniqueConflictError& e) {
        EXPECT_EQ(e.kind(), ConflictKind::Fingerprint);
    }
    EXPECT_FALSE(store.identifier_exists("zzzz"));
}

TEST_F(RecordStoreTest, ValidateNormalizesRequest) {
    AllocationRequest req = make_request(3, "JPG");
    req.fingerprint = make_fingerprint(3);
    for (auto& c : req.fingerprint) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    req.media_type.clear();
    req.hash_algorithm.clear();
    req.metadata = Metadata{};

    AllocationRequest out = store.validate(req);
    EXPECT_EQ(out.fingerprint, make_fingerprint(3));
    EXPECT_EQ(out.extension, ".jpg");
    EXPECT_EQ(out.media_type, "application/octet-stream");
    EXPECT_EQ(out.hash_algorithm, "sha512");
    EXPECT_FALSE(out.metadata.has_value());
}

TEST_F(RecordStoreTest, ValidateRejectsBadInput) {
    AllocationRequest req = make_request(4);
    req.size_bytes = -1;
    EXPECT_THROW(store.validate(req), InvalidArgumentError);

    req = make_request(4);
    req.fingerprint = "not-a-digest";
    EXPECT_THROW(store.validate(req), InvalidArgumentError);
}

TEST_F(RecordStoreTest, PendingRecordGetsIdentifierOnce) {
    AllocationRecord pending = store.register_pending(make_request(5));
    EXPECT_FALSE(pending.has_identifier());
    EXPECT_TRUE(store.operations_for(pending.id).empty());

    IdentifierCandidate first{"pend", 4, "aa"};
    auto assigned = store.assign_identifier(make_fingerprint(5), first, AssignAudit{});
    ASSERT_TRUE(assigned.has_value());
    EXPECT_EQ(*assigned->identifier, "pend");
    EXPECT_EQ(assigned->id, pending.id);

    IdentifierCandidate second{"late", 4, "bb"};
    EXPECT_FALSE(store.assign_identifier(make_fingerprint(5), second, AssignAudit{}).has_value());
    EXPECT_FALSE(store.identifier_exists("late"));
    EXPECT_EQ(*store.find_by_fingerprint(make_fingerprint(5))->identifier, "pend");
}

TEST_F(RecordStoreTest, ResolveCountsAccess) {
    AllocationRecord rec = commit(6, "seen");

    auto first = store.resolve("seen");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->access_count, 1);
    EXPECT_TRUE(first->last_accessed_at.has_value());

    auto second = store.resolve("seen");
    EXPECT_EQ(second->access_count, 2);

    auto ops = store.operations_for(rec.id);
    ASSERT_EQ(ops.size(), 3u);
    EXPECT_EQ(ops[1].kind, OperationKind::Access);
    EXPECT_EQ(text_field(ops[1], "identifier"), "seen");

    EXPECT_FALSE(store.resolve("none").has_value());
}

TEST_F(RecordStoreTest, StatusChangesAreOneWay) {
    AllocationRecord rec = commit(7, "gone");

    EXPECT_THROW(store.set_status(make_fingerprint(7), RecordStatus::Active), InvalidArgumentError);
    EXPECT_TRUE(store.set_status(make_fingerprint(7), RecordStatus::Deleted, "takedown"));
    EXPECT_FALSE(store.set_status(make_fingerprint(7), RecordStatus::Archived));

    auto deleted = store.find_by_fingerprint(make_fingerprint(7));
    EXPECT_EQ(deleted->status, RecordStatus::Deleted);
    // identifier stays bound so it is never handed out again
    EXPECT_TRUE(store.identifier_exists("gone"));
    EXPECT_FALSE(store.resolve("gone").has_value());

    auto ops = store.operations_for(rec.id);
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[1].kind, OperationKind::Delete);
    EXPECT_EQ(text_field(ops[1], "reason"), "takedown");
}

TEST_F(RecordStoreTest, UploadMetadata) {
    AllocationRecord rec = commit(8, "upld");

    EXPECT_THROW(store.update_upload_metadata(make_fingerprint(8), "", ""), InvalidArgumentError);
    EXPECT_TRUE(store.update_upload_metadata(make_fingerprint(8), "upld.png", "https://i.example.net/upld.png"));

    auto updated = store.find_by_fingerprint(make_fingerprint(8));
    EXPECT_EQ(updated->storage_key, "upld.png");
    EXPECT_EQ(updated->url, "https://i.example.net/upld.png");
    EXPECT_EQ(store.operations_for(rec.id).back().kind, OperationKind::Update);

    EXPECT_FALSE(store.update_upload_metadata(make_fingerprint(9), "x.png", ""));
}

TEST_F(RecordStoreTest, DedupHitIsLogged) {
    AllocationRecord rec = commit(10, "dupe");
    store.record_dedup_hit(rec, "register");

    auto ops = store.operations_for(rec.id);
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[1].kind, OperationKind::DedupHit);
    EXPECT_EQ(text_field(ops[1], "source"), "register");
}
