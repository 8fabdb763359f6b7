// llamaload - Library Loader Tests

#include "function_binding.hpp"
#include "library_loader.hpp"
#include "test_support.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

using namespace llamaload;
using llamaload::testing::TempDir;
using llamaload::testing::writeFile;

namespace {

// 绑定一个必需符号和一个可选符号，名字可替换
class RecordingBinder : public SymbolBinder {
public:
    std::string required_name = "llama_backend_init";
    std::string optional_name = "ggml_backend_cuda_init";

    void (*required)() = nullptr;
    void* (*optional)(int) = nullptr;

    std::atomic<int> binds{0};
    std::atomic<int> resets{0};

    Status bind(const SymbolRegistry& registry, NativeHandle primary) override {
        binds++;
        std::vector<BindSpec> specs = {
            bindSpec(required, required_name),
            bindSpec(optional, optional_name, Requirement::Optional),
        };
        return bindSet(registry, primary, specs);
    }

    void reset() override {
        resets++;
        required = nullptr;
        optional = nullptr;
    }
};

// 返回固定路径并附带一个临时目录
class ScratchResolver : public PathResolver {
public:
    ScratchResolver(std::string path, std::string scratch)
        : path_(std::move(path)), scratch_(std::move(scratch)) {}

    Status resolve(ResolvedArtifact& out) const override {
        out.path = path_;
        out.scratch_dir = scratch_;
        return Status::OK();
    }

private:
    std::string path_;
    std::string scratch_;
};

LoaderOptions noSiblings() {
    LoaderOptions options;
    options.preload_siblings = false;
    return options;
}

} // namespace

TEST_CASE("load is idempotent", "[orchestrator]")
{
    FixedPathResolver resolver(LLAMALOAD_FAKE_LLAMA);
    RecordingBinder binder;
    LibraryLoader loader(resolver, binder, noSiblings());

    CHECK(loader.state() == LoadState::Unloaded);
    CHECK(loader.handle() == kInvalidHandle);

    REQUIRE(loader.load().ok());
    CHECK(loader.isLoaded());
    CHECK(loader.state() == LoadState::Loaded);
    CHECK(loader.path() == LLAMALOAD_FAKE_LLAMA);

    const NativeHandle handle = loader.handle();
    const auto handles = loader.handles();
    const uint64_t session = loader.session();
    CHECK(handle != kInvalidHandle);
    CHECK(handles.size() == 1);
    CHECK(handles.front() == handle);

    REQUIRE(loader.load().ok());
    REQUIRE(loader.ensureLoaded().ok());
    CHECK(loader.handle() == handle);
    CHECK(loader.handles() == handles);
    CHECK(loader.session() == session);
    CHECK(binder.binds.load() == 1);

    CHECK(loader.unload().ok());
}

TEST_CASE("unload leaves a clean state", "[orchestrator]")
{
    FixedPathResolver resolver(LLAMALOAD_FAKE_LLAMA);
    RecordingBinder binder;
    LibraryLoader loader(resolver, binder, noSiblings());

    CHECK(loader.unload().ok());

    REQUIRE(loader.load().ok());
    const NativeHandle first = loader.handle();
    const uint64_t first_session = loader.session();
    REQUIRE(binder.required != nullptr);

    REQUIRE(loader.unload().ok());
    CHECK_FALSE(loader.isLoaded());
    CHECK(loader.handle() == kInvalidHandle);
    CHECK(loader.handles().empty());
    CHECK(loader.path().empty());
    CHECK_FALSE(loader.dynamicLoader().isOpen(first));
    CHECK(binder.required == nullptr);
    CHECK(binder.resets.load() == 1);
    CHECK_FALSE(loader.findSymbol("llama_backend_init").valid());

    REQUIRE(loader.load().ok());
    CHECK(loader.session() == first_session + 1);
    CHECK(loader.handles().size() == 1);
    CHECK(binder.required != nullptr);

    CHECK(loader.unload().ok());
}

TEST_CASE("optional and required symbols", "[orchestrator]")
{
    FixedPathResolver resolver(LLAMALOAD_FAKE_LLAMA);
    RecordingBinder binder;
    LibraryLoader loader(resolver, binder, noSiblings());

    SECTION("absent optional symbol does not fail the load")
    {
        binder.optional_name = "backend_gpu_init";
        REQUIRE(loader.load().ok());
        CHECK(binder.required != nullptr);
        CHECK(binder.optional == nullptr);
        CHECK(loader.unload().ok());
    }

    SECTION("absent required symbol fails the load")
    {
        binder.required_name = "backend_gpu_init";
        Status status = loader.load();
        CHECK(status.code() == ErrorCode::SymbolNotFound);
        CHECK(status.message().find("backend_gpu_init") != std::string::npos);
        // 绑定失败时补上库路径
        CHECK(status.message().find(LLAMALOAD_FAKE_LLAMA) != std::string::npos);
        CHECK_FALSE(loader.isLoaded());
        CHECK(loader.handle() == kInvalidHandle);
        CHECK(loader.handles().empty());
        CHECK(binder.resets.load() == 1);

        // 不会自动重试，再次调用得到同样的失败
        CHECK(loader.load().code() == ErrorCode::SymbolNotFound);
        CHECK(binder.binds.load() == 2);
    }
}

TEST_CASE("load failures are surfaced", "[orchestrator]")
{
    RecordingBinder binder;

    SECTION("artifact unavailable passes through unchanged")
    {
        FixedPathResolver resolver("");
        LibraryLoader loader(resolver, binder);
        Status status = loader.load();
        CHECK(status.code() == ErrorCode::ArtifactUnavailable);
        CHECK(binder.binds.load() == 0);
    }

    SECTION("missing file names the path")
    {
        FixedPathResolver resolver("/nonexistent/llamaload/libllama.so");
        LibraryLoader loader(resolver, binder);
        Status status = loader.load();
        CHECK(status.code() == ErrorCode::LoadFailed);
        CHECK(status.failure() == LoadFailure::FileNotFound);
        const std::string path = "/nonexistent/llamaload/libllama.so";
        const size_t first = status.message().find(path);
        REQUIRE(first != std::string::npos);
        CHECK(status.message().find(path, first + 1) == std::string::npos);
        CHECK_FALSE(loader.isLoaded());
    }
}

TEST_CASE("scratch directory is released", "[orchestrator]")
{
    TempDir parent;
    const auto scratch = parent.path() / "scratch";
    writeFile(scratch / "marker", "x");

    RecordingBinder binder;

    SECTION("on unload")
    {
        ScratchResolver resolver(LLAMALOAD_FAKE_LLAMA, scratch.string());
        LibraryLoader loader(resolver, binder, noSiblings());
        REQUIRE(loader.load().ok());
        CHECK(std::filesystem::exists(scratch));
        REQUIRE(loader.unload().ok());
        CHECK_FALSE(std::filesystem::exists(scratch));
    }

    SECTION("after a failed load")
    {
        binder.required_name = "backend_gpu_init";
        ScratchResolver resolver(LLAMALOAD_FAKE_LLAMA, scratch.string());
        LibraryLoader loader(resolver, binder, noSiblings());
        CHECK_FALSE(loader.load().ok());
        CHECK_FALSE(std::filesystem::exists(scratch));
    }
}

TEST_CASE("symbol lookup through the loader", "[orchestrator]")
{
    FixedPathResolver resolver(LLAMALOAD_FAKE_LLAMA);
    RecordingBinder binder;
    LibraryLoader loader(resolver, binder, noSiblings());

    using CountFn = int (*)();
    CHECK(loader.getSymbol<CountFn>("fake_backend_init_count") == nullptr);

    REQUIRE(loader.load().ok());
    auto count = loader.getSymbol<CountFn>("fake_backend_init_count");
    REQUIRE(count != nullptr);
    const int before = count();
    binder.required();
    CHECK(count() == before + 1);

    SymbolBinding binding = loader.findSymbol("llama_backend_init");
    CHECK(binding.valid());
    CHECK(binding.owner == loader.handle());

    CHECK(loader.unload().ok());
}

TEST_CASE("concurrent loads", "[orchestrator][concurrency]")
{
    FixedPathResolver resolver(LLAMALOAD_FAKE_LLAMA);
    RecordingBinder binder;
    LibraryLoader loader(resolver, binder, noSiblings());

    constexpr int kThreads = 50;
    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; i++) {
        threads.emplace_back([&loader, &ok] {
            if (loader.load().ok() && loader.isLoaded()) {
                ok++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(ok.load() == kThreads);
    CHECK(binder.binds.load() == 1);
    CHECK(loader.session() == 1);
    CHECK(loader.handles().size() == 1);

    CHECK(loader.unload().ok());
}

TEST_CASE("concurrent load, unload and reads", "[orchestrator][concurrency]")
{
    FixedPathResolver resolver(LLAMALOAD_FAKE_LLAMA);
    RecordingBinder binder;
    LibraryLoader loader(resolver, binder, noSiblings());

    constexpr int kThreads = 8;
    constexpr int kRounds = 20;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; i++) {
        threads.emplace_back([&loader, &failures] {
            for (int round = 0; round < kRounds; round++) {
                if (!loader.load().ok()) failures++;
                // 其他线程可能已经卸载，这里只要求读取本身一致
                const auto handles = loader.handles();
                if (loader.isLoaded() && handles.size() > 1) failures++;
                (void)loader.handle();
                (void)loader.findSymbol("llama_backend_init");
                if (!loader.unload().ok()) failures++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(failures.load() == 0);
    CHECK_FALSE(loader.isLoaded());
    CHECK(loader.handles().empty());
    CHECK(binder.binds.load() >= 1);
    CHECK(binder.binds.load() == binder.resets.load());
    CHECK(loader.session() == static_cast<uint64_t>(binder.binds.load()));
}
