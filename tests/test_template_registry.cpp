/**
 * @file test_template_registry.cpp
 * @brief Unit tests for the per-user TemplateRegistry
 */

#include <gtest/gtest.h>
#include <fpservice/storage/TemplateRegistry.hpp>
#include <fpservice/core/exception.h>

#include "SessionTestDoubles.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <vector>

using namespace fpservice;
using namespace fpservice::storage;
using fpservice::testing::TempDir;

class TemplateRegistryTest : public ::testing::Test {
protected:
    TemplateRegistry::Options options() const {
        TemplateRegistry::Options opts;
        opts.file_path = dir_.file("fingerprint_templates.yaml");
        return opts;
    }

    std::unique_ptr<TemplateRegistry> openRegistry(int32_t userId = 0) const {
        return std::make_unique<TemplateRegistry>(userId, options());
    }

    TempDir dir_;
};

TEST_F(TemplateRegistryTest, MissingFileStartsEmpty) {
    auto registry = openRegistry();
    EXPECT_EQ(registry->size(), 0u);
    EXPECT_TRUE(registry->list().empty());
    EXPECT_FALSE(registry->find(1).has_value());
}

TEST_F(TemplateRegistryTest, AddThenRemoveLeavesRegistryEmpty) {
    auto registry = openRegistry();

    Template added = registry->add(7, 1);
    EXPECT_EQ(added.template_id, 7);
    EXPECT_EQ(added.group_id, 1);
    EXPECT_FALSE(added.name.empty());

    auto listed = registry->list();
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].template_id, 7);
    EXPECT_EQ(listed[0].name, added.name);

    EXPECT_TRUE(registry->remove(7));
    EXPECT_TRUE(registry->list().empty());
    EXPECT_FALSE(registry->remove(7));
}

TEST_F(TemplateRegistryTest, GeneratedNamesAreUnique) {
    auto registry = openRegistry();
    const int count = 12;
    for (int i = 0; i < count; ++i) {
        registry->add(100 + i, 0);
    }

    std::set<std::string> names;
    for (const auto& t : registry->list()) {
        names.insert(t.name);
    }
    EXPECT_EQ(names.size(), static_cast<size_t>(count));
    EXPECT_EQ(names.count("Finger 1"), 1u);
    EXPECT_EQ(names.count("Finger 12"), 1u);
}

TEST_F(TemplateRegistryTest, GeneratedNameFillsLowestFreeSlot) {
    auto registry = openRegistry();
    registry->add(1, 0);
    registry->add(2, 0);
    registry->add(3, 0);
    registry->remove(2);

    EXPECT_EQ(registry->add(4, 0).name, "Finger 2");
}

TEST_F(TemplateRegistryTest, DuplicateSuppliedNameIsReplaced) {
    auto registry = openRegistry();
    registry->add(1, 0, "Thumb");
    Template second = registry->add(2, 0, "Thumb");

    EXPECT_NE(second.name, "Thumb");
    EXPECT_EQ(registry->find(1)->name, "Thumb");
}

TEST_F(TemplateRegistryTest, RenameWithEmptyNameIsNoOp) {
    auto registry = openRegistry();
    registry->add(5, 0, "Index");

    EXPECT_FALSE(registry->rename(5, ""));
    EXPECT_EQ(registry->find(5)->name, "Index");

    EXPECT_TRUE(registry->rename(5, "Ring"));
    EXPECT_EQ(registry->find(5)->name, "Ring");
    EXPECT_FALSE(registry->rename(6, "Nothing"));
}

TEST_F(TemplateRegistryTest, ListReturnsIndependentCopy) {
    auto registry = openRegistry();
    registry->add(1, 0);

    auto snapshot = registry->list();
    snapshot[0].name = "changed";
    snapshot.clear();

    ASSERT_EQ(registry->size(), 1u);
    EXPECT_NE(registry->list()[0].name, "changed");
}

TEST_F(TemplateRegistryTest, StatePersistsAcrossInstances) {
    {
        auto registry = openRegistry(3);
        registry->add(10, 2, "Left thumb");
        registry->add(11, 2);
        registry->add(12, 2);
        registry->remove(11);
        registry->rename(12, "Right index");
        registry->flush();
        EXPECT_FALSE(registry->hasPendingWrites());
    }

    auto reopened = openRegistry(3);
    auto listed = reopened->list();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0], Template("Left thumb", 2, 10, 0));
    EXPECT_EQ(listed[1], Template("Right index", 2, 12, 0));
}

TEST_F(TemplateRegistryTest, DestructionFlushesPendingWrites) {
    {
        auto registry = openRegistry();
        registry->add(1, 0);
        registry->add(2, 0);
    }
    EXPECT_EQ(openRegistry()->size(), 2u);
}

TEST_F(TemplateRegistryTest, MalformedFileFailsLoad) {
    {
        std::ofstream out(options().file_path);
        out << "templates: [ {";
    }

    try {
        openRegistry();
        FAIL() << "expected FileException";
    } catch (const core::FileException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_PARSE);
    }
}

TEST_F(TemplateRegistryTest, WriteFailurePoisonsRegistry) {
    auto registry = openRegistry();
    registry->add(1, 0);
    registry->flush();

    std::filesystem::create_directory(registry->getFilePath() + ".new");
    registry->add(2, 0);
    EXPECT_THROW(registry->flush(), core::FileException);
    EXPECT_THROW(registry->add(3, 0), core::FileException);
    EXPECT_THROW(registry->remove(1), core::FileException);
}

TEST_F(TemplateRegistryTest, RefusedMutationLeavesStateUntouched) {
    auto registry = openRegistry();
    registry->add(1, 0, "Thumb");
    registry->flush();

    std::filesystem::create_directory(registry->getFilePath() + ".new");
    registry->add(2, 0);
    EXPECT_THROW(registry->flush(), core::FileException);
    const auto before = registry->list();
    ASSERT_EQ(before.size(), 2u);

    EXPECT_THROW(registry->add(3, 0), core::FileException);
    EXPECT_THROW(registry->remove(1), core::FileException);
    EXPECT_THROW(registry->rename(1, "Index"), core::FileException);

    EXPECT_EQ(registry->list(), before);
    EXPECT_FALSE(registry->find(3).has_value());
    EXPECT_EQ(registry->find(1)->name, "Thumb");
}

TEST_F(TemplateRegistryTest, ConcurrentMutationsApplyNetEffect) {
    auto registry = openRegistry();
    const int threads = 4;
    const int perThread = 25;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&registry, t]() {
            for (int i = 0; i < perThread; ++i) {
                int32_t id = t * 1000 + i;
                registry->add(id, t);
                // remove every even-numbered template again
                if (i % 2 == 0) {
                    registry->remove(id);
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    registry->flush();

    const size_t expected = static_cast<size_t>(threads * (perThread / 2));
    EXPECT_EQ(registry->size(), expected);

    std::set<std::string> names;
    for (const auto& t : registry->list()) {
        names.insert(t.name);
        EXPECT_EQ(t.template_id % 2, 1);
    }
    EXPECT_EQ(names.size(), expected);

    EXPECT_EQ(openRegistry()->size(), expected);
}
