#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "../libdroply/include/errors.hpp"
#include "../libdroply/include/module_loader.hpp"

namespace droply {

TEST(ModuleLoader, FallsBackWithoutModuleDir) {
  const PluginRegistry registry(Platform::Server);
  ModuleLoader loader(registry, {});
  const auto handle = loader.compression("gzip");
  EXPECT_EQ(handle.origin(), CodecOrigin::Fallback);
  EXPECT_EQ(handle.kind(), PluginKind::Compression);
  EXPECT_EQ(handle.name(), "gzip");
  EXPECT_TRUE(loader.is_cached("gzip", PluginKind::Compression));
  EXPECT_FALSE(loader.is_cached("gzip", PluginKind::Archive));
}

TEST(ModuleLoader, FallsBackWhenModuleMissing) {
  const PluginRegistry registry(Platform::Server);
  ModuleLoader loader(registry, "/nonexistent/droply-modules");
  EXPECT_EQ(loader.archive("tar").origin(), CodecOrigin::Fallback);
}

TEST(ModuleLoader, LoadsNativeModule) {
  const PluginRegistry registry(Platform::Server);
  ModuleLoader loader(registry, DROPLY_TEST_MODULE_DIR);
  const auto handle = loader.compression("brotli");
  EXPECT_EQ(handle.origin(), CodecOrigin::Native);

  const Bytes input(2000, 'z');
  const auto& codec = handle.compression();
  EXPECT_EQ(codec.decompress(codec.compress(input, 5)), input);
}

TEST(ModuleLoader, NoModuleForOtherPlatform) {
  const PluginRegistry registry(Platform::Bundler);
  ModuleLoader loader(registry, DROPLY_TEST_MODULE_DIR);
  EXPECT_EQ(loader.compression("gzip").origin(), CodecOrigin::Fallback);
}

TEST(ModuleLoader, RejectsUnsupportedNames) {
  const PluginRegistry registry(Platform::Server);
  ModuleLoader loader(registry, {});
  EXPECT_THROW(loader.compression("zstd-unlisted"), ValidationError);
  EXPECT_FALSE(loader.is_cached("zstd-unlisted", PluginKind::Compression));

  const PluginRegistry browser(Platform::Browser);
  ModuleLoader browserLoader(browser, {});
  EXPECT_THROW(browserLoader.archive("tar"), UnsupportedPlatformError);
}

TEST(ModuleLoader, KindMismatchThrows) {
  const PluginRegistry registry(Platform::Server);
  ModuleLoader loader(registry, {});
  const auto handle = loader.archive("zip");
  EXPECT_THROW(static_cast<void>(handle.compression()), LoadFailure);
  EXPECT_NO_THROW(static_cast<void>(handle.archive()));
}

TEST(ModuleLoader, ConcurrentGetSharesOneInstance) {
  const PluginRegistry registry(Platform::Server);
  ModuleLoader loader(registry, DROPLY_TEST_MODULE_DIR);

  constexpr int kThreads = 8;
  std::vector<const ICompressionCodec*> seen(kThreads, nullptr);
  std::atomic<bool> go{false};
  {
    std::vector<std::jthread> threads;
    for (int i = 0; i < kThreads; ++i) {
      threads.emplace_back([&, i] {
        while (!go.load()) {
          std::this_thread::yield();
        }
        seen[static_cast<std::size_t>(i)] = &loader.compression("gzip").compression();
      });
    }
    go.store(true);
  }
  for (const auto* codec : seen) {
    EXPECT_EQ(codec, seen.front());
  }
}

TEST(ModuleLoader, ReloadCreatesNewInstance) {
  const PluginRegistry registry(Platform::Server);
  ModuleLoader loader(registry, {});
  const auto first = loader.compression("gzip");
  const auto* before = &first.compression();

  loader.reload("gzip");
  EXPECT_FALSE(loader.is_cached("gzip", PluginKind::Compression));
  const auto second = loader.compression("gzip");
  EXPECT_NE(&second.compression(), before);

  loader.archive("zip");
  loader.clear_cache();
  EXPECT_FALSE(loader.is_cached("zip", PluginKind::Archive));
}

TEST(ModuleLoader, ModulePathFollowsPlatform) {
  const PluginRegistry registry(Platform::Browser);
  const ModuleLoader loader(registry, "/opt/droply");
  EXPECT_EQ(loader.module_path(), std::filesystem::path("/opt/droply/libdroply_browser.so"));

  const ModuleLoader none(registry, {});
  EXPECT_TRUE(none.module_path().empty());
}

}  // namespace droply
