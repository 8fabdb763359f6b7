// llamaload - Symbol Registry Tests

#include "dynamic_loader.hpp"
#include "symbol_registry.hpp"

#include <catch2/catch.hpp>

using namespace llamaload;

namespace {

using NameFn = const char* (*)();

std::string moduleName(NativeHandle handle, const DynamicLoader& loader) {
    auto fn = reinterpret_cast<NameFn>(loader.resolve(handle, "module_name"));
    return fn ? fn() : "";
}

} // namespace

TEST_CASE("symbol registry", "[registry]")
{
    DynamicLoader loader;
    NativeHandle a = kInvalidHandle;
    NativeHandle b = kInvalidHandle;
    REQUIRE(loader.openModule(LLAMALOAD_MODULE_A, a).ok());
    REQUIRE(loader.openModule(LLAMALOAD_MODULE_B, b).ok());
    REQUIRE(moduleName(a, loader) == "A");
    REQUIRE(moduleName(b, loader) == "B");

    SymbolRegistry registry(loader);

    SECTION("register deduplicates and ignores invalid handles")
    {
        CHECK(registry.registerHandle(a));
        CHECK_FALSE(registry.registerHandle(a));
        CHECK_FALSE(registry.registerHandle(kInvalidHandle));
        CHECK(registry.registerHandle(b));
        CHECK(registry.size() == 2);
        CHECK(registry.handles()[0] == a);
        CHECK(registry.handles()[1] == b);
    }

    SECTION("fallback to a sibling, A registered first")
    {
        registry.registerHandle(a);
        registry.registerHandle(b);

        SymbolBinding binding = registry.resolve("fallback_symbol", a);
        REQUIRE(binding.valid());
        CHECK(binding.owner == b);
        CHECK(binding.address == loader.resolve(b, "fallback_symbol"));
    }

    SECTION("fallback to a sibling, B registered first")
    {
        registry.registerHandle(b);
        registry.registerHandle(a);

        SymbolBinding binding = registry.resolve("fallback_symbol", a);
        REQUIRE(binding.valid());
        CHECK(binding.owner == b);
    }

    SECTION("preferred handle wins")
    {
        registry.registerHandle(a);
        registry.registerHandle(b);

        SymbolBinding binding = registry.resolve("module_name", b);
        REQUIRE(binding.valid());
        CHECK(binding.owner == b);
        CHECK(reinterpret_cast<NameFn>(binding.address)() == std::string("B"));
    }

    SECTION("missing everywhere")
    {
        registry.registerHandle(a);
        registry.registerHandle(b);

        SymbolBinding binding = registry.resolve("does_not_exist", a);
        CHECK_FALSE(binding.valid());
        CHECK(binding.name == "does_not_exist");
    }

    SECTION("clear drops all handles")
    {
        registry.registerHandle(a);
        registry.registerHandle(b);
        registry.clear();
        CHECK(registry.size() == 0);
        CHECK_FALSE(registry.resolve("fallback_symbol", kInvalidHandle).valid());
    }

    CHECK(loader.close(b).ok());
    CHECK(loader.close(a).ok());
}
