#include <gtest/gtest.h>

#include "modelfetch/errors.hpp"
#include "modelfetch/model_registry.hpp"
#include "modelfetch/state_store.hpp"

#include <string>

using namespace modelfetch;

namespace {

StoredModel linked(const std::string& name, const std::string& path) {
    StoredModel model;
    model.name = name;
    model.path = path;
    model.size = 1234;
    model.modified = "2024-01-01T00:00:00Z";
    return model;
}

} // namespace

TEST(ExternalModelRegistry, AddedModelsSurviveReload) {
    MemoryStateStore store;
    {
        ExternalModelRegistry registry(store);
        registry.load();
        registry.add(linked("llama.gguf", "/data/shared/llama.gguf"));
    }

    ExternalModelRegistry registry(store);
    registry.load();
    ASSERT_EQ(registry.models().size(), 1u);
    const auto& model = registry.models().front();
    EXPECT_EQ(model.name, "llama.gguf");
    EXPECT_EQ(model.path, "/data/shared/llama.gguf");
    EXPECT_EQ(model.size, 1234u);
    EXPECT_TRUE(model.is_external);
    EXPECT_TRUE(registry.findByName("llama.gguf").has_value());
    EXPECT_FALSE(registry.findByName("other.gguf").has_value());
}

TEST(ExternalModelRegistry, PathsAreComparedNormalized) {
    MemoryStateStore store;
    ExternalModelRegistry registry(store);
    registry.add(linked("llama.gguf", "/data/shared/../shared/llama.gguf"));

    EXPECT_TRUE(registry.findByPath("/data/shared/llama.gguf").has_value());
    EXPECT_FALSE(registry.removeByPath("/data/other/llama.gguf"));
    EXPECT_TRUE(registry.removeByPath("/data/./shared/llama.gguf"));
    EXPECT_TRUE(registry.models().empty());
    EXPECT_EQ(store.get(ExternalModelRegistry::kRegistryKey).value_or(""), "[]");
}

TEST(ExternalModelRegistry, MalformedEntriesAreSkipped) {
    MemoryStateStore store;
    store.set(ExternalModelRegistry::kRegistryKey,
              R"([{"name":"ok.gguf","path":"/m/ok.gguf","size":"big"},{"name":7},"junk"])");

    ExternalModelRegistry registry(store);
    registry.load();
    ASSERT_EQ(registry.models().size(), 1u);
    EXPECT_EQ(registry.models().front().name, "ok.gguf");
    EXPECT_EQ(registry.models().front().size, 0u);

    store.set(ExternalModelRegistry::kRegistryKey, "{not json");
    registry.load();
    EXPECT_TRUE(registry.models().empty());
}

TEST(ExternalModelRegistry, FailedWriteLeavesListUnchanged) {
    MemoryStateStore store;
    ExternalModelRegistry registry(store);
    registry.add(linked("a.gguf", "/m/a.gguf"));

    store.failWrites(true);
    EXPECT_THROW(registry.add(linked("b.gguf", "/m/b.gguf")), PersistenceError);
    EXPECT_THROW(registry.removeByPath("/m/a.gguf"), PersistenceError);
    EXPECT_THROW(registry.clear(), PersistenceError);
    ASSERT_EQ(registry.models().size(), 1u);
    EXPECT_EQ(registry.models().front().name, "a.gguf");
    store.failWrites(false);

    registry.clear();
    EXPECT_TRUE(registry.models().empty());
}

TEST(ExternalModelRegistry, UnencodableNameFailsAsPersistenceError) {
    MemoryStateStore store;
    ExternalModelRegistry registry(store);
    EXPECT_THROW(registry.add(linked("bad\xff.gguf", "/m/bad.gguf")), PersistenceError);
    EXPECT_TRUE(registry.models().empty());
}
