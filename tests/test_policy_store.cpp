// ---------------------------------------------------------------------------
// test_policy_store.cpp
//
// PolicyStore CRUD 단위 테스트
//
// [테스트 범위]
// - create / get / list / update / remove
// - 검증 오류, 이름 중복, 없는 정책
// - snapshot 격리 (이후 변경이 기존 스냅샷에 보이지 않음)
// - replace_all all-or-nothing
// - 동시 읽기/쓰기 (크래시 없음)
// ---------------------------------------------------------------------------

#include "policy/compliance_templates.hpp"
#include "policy/policy_store.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

TEST(PolicyStore, CreateAndGet) {
    PolicyStore store;
    ASSERT_TRUE(store.create(create_custom_policy("Alpha", "first")).has_value());

    const auto got = store.get("Alpha");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->description, "first");
    EXPECT_EQ(store.size(), 1u);
    EXPECT_FALSE(store.get("Beta").has_value());
}

TEST(PolicyStore, DuplicateNameRejected) {
    PolicyStore store;
    ASSERT_TRUE(store.create(create_custom_policy("Alpha")).has_value());

    const auto again = store.create(create_custom_policy("Alpha"));
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, PolicyErrorCode::kDuplicateName);
    EXPECT_EQ(again.error().message, "Policy 'Alpha' already exists");
    EXPECT_EQ(store.size(), 1u);
}

TEST(PolicyStore, InvalidPolicyRejected) {
    PolicyStore store;

    const auto unnamed = store.create(create_custom_policy(""));
    ASSERT_FALSE(unnamed.has_value());
    EXPECT_EQ(unnamed.error().code, PolicyErrorCode::kMissingName);

    const auto bad_adjust = store.create(create_custom_policy("X", "", {}, {}, -101));
    ASSERT_FALSE(bad_adjust.has_value());
    EXPECT_EQ(bad_adjust.error().code, PolicyErrorCode::kInvalidField);
    EXPECT_EQ(bad_adjust.error().field, "rules.risk_adjustment");

    EXPECT_EQ(store.size(), 0u);
}

TEST(PolicyStore, ListPreservesInsertionOrderAndFiltersDisabled) {
    PolicyStore store;
    auto off = create_custom_policy("B");
    off.enabled = false;
    ASSERT_TRUE(store.create(create_custom_policy("A")).has_value());
    ASSERT_TRUE(store.create(off).has_value());
    ASSERT_TRUE(store.create(create_custom_policy("C")).has_value());

    const auto all = store.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].name, "A");
    EXPECT_EQ(all[1].name, "B");
    EXPECT_EQ(all[2].name, "C");

    const auto enabled = store.list(true);
    ASSERT_EQ(enabled.size(), 2u);
    EXPECT_EQ(enabled[1].name, "C");
}

TEST(PolicyStore, UpdateReplacesInPlace) {
    PolicyStore store;
    ASSERT_TRUE(store.create(create_custom_policy("A")).has_value());
    ASSERT_TRUE(store.create(create_custom_policy("B")).has_value());

    auto renamed = create_custom_policy("A2", "renamed");
    ASSERT_TRUE(store.update("A", renamed).has_value());

    const auto all = store.list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].name, "A2") << "update keeps the position";
    EXPECT_FALSE(store.get("A").has_value());
}

TEST(PolicyStore, UpdateErrors) {
    PolicyStore store;
    ASSERT_TRUE(store.create(create_custom_policy("A")).has_value());
    ASSERT_TRUE(store.create(create_custom_policy("B")).has_value());

    const auto missing = store.update("Z", create_custom_policy("Z"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, PolicyErrorCode::kNotFound);
    EXPECT_EQ(missing.error().message, "Policy 'Z' not found");

    const auto clash = store.update("A", create_custom_policy("B"));
    ASSERT_FALSE(clash.has_value());
    EXPECT_EQ(clash.error().code, PolicyErrorCode::kDuplicateName);

    const auto invalid = store.update("A", create_custom_policy("A", "", {}, {}, 0, 200));
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().field, "rules.block_threshold");
}

TEST(PolicyStore, Remove) {
    PolicyStore store;
    ASSERT_TRUE(store.create(create_custom_policy("A")).has_value());

    EXPECT_TRUE(store.remove("A").has_value());
    EXPECT_EQ(store.size(), 0u);

    const auto again = store.remove("A");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, PolicyErrorCode::kNotFound);
}

TEST(PolicyStore, SnapshotIsolation) {
    PolicyStore store;
    ASSERT_TRUE(store.create(create_custom_policy("A")).has_value());

    const auto before = store.snapshot();
    ASSERT_TRUE(store.create(create_custom_policy("B")).has_value());
    ASSERT_TRUE(store.remove("A").has_value());

    ASSERT_EQ(before->size(), 1u);
    EXPECT_EQ((*before)[0].name, "A");
    EXPECT_EQ(store.snapshot()->size(), 1u);
    EXPECT_EQ((*store.snapshot())[0].name, "B");
}

TEST(PolicyStore, ReplaceAllIsAllOrNothing) {
    PolicyStore store;
    ASSERT_TRUE(store.create(create_custom_policy("Keep")).has_value());

    const auto dup = store.replace_all({create_custom_policy("X"), create_custom_policy("X")});
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, PolicyErrorCode::kDuplicateName);
    EXPECT_TRUE(store.get("Keep").has_value());

    ASSERT_TRUE(store.replace_all({create_custom_policy("X"), create_custom_policy("Y")}).has_value());
    EXPECT_EQ(store.size(), 2u);
    EXPECT_FALSE(store.get("Keep").has_value());
}

TEST(PolicyStore, ConcurrentReadersAndWriter) {
    PolicyStore store;

    std::thread writer([&store] {
        for (int i = 0; i < 200; ++i) {
            const std::string name = "P" + std::to_string(i);
            ASSERT_TRUE(store.create(create_custom_policy(name)).has_value());
        }
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&store] {
            for (int i = 0; i < 200; ++i) {
                const auto snap = store.snapshot();
                for (const auto& p : *snap) {
                    EXPECT_FALSE(p.name.empty());
                }
            }
        });
    }

    writer.join();
    for (auto& t : readers) {
        t.join();
    }
    EXPECT_EQ(store.size(), 200u);
}
