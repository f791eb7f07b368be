#include <array>
#include <cstddef>
#include <string>

#include <benchmark/benchmark.h>

#include "touchseal/security/kdf.hpp"

namespace {
// 43 characters, the size of an encoded 32-byte challenge.
static const std::string kChallenge = "q7Zl3m0Yx1vB4cH8nK2pR5sT9wA6dE0fG3jL7oU1iQy";
static const std::string kFingerprint = "SHA256:uNiVztksCsDhcc0u9e8BujQXVUpKZIDTMczCvj3tD2s";

static std::array<touchseal::core::u8, 512> make_signature() {
    std::array<touchseal::core::u8, 512> sig{};
    for (size_t i = 0; i < sig.size(); ++i) {
        sig[i] = static_cast<touchseal::core::u8>((i * 31u) & 0xffu);
    }
    return sig;
}

static void run_derive_key(benchmark::State& state, touchseal::security::HashId hash) {
    const auto sig = make_signature();
    const size_t n = static_cast<size_t>(state.range(0));
    const touchseal::security::BufferView sig_view{sig.data(), static_cast<touchseal::security::u32>(n)};

    for (auto _ : state) {
        touchseal::security::Key256 out{};
        const touchseal::core::Status s = touchseal::security::derive_key(hash,
            sig_view,
            touchseal::core::view_of(kChallenge),
            touchseal::core::view_of(kFingerprint),
            &out);
        benchmark::DoNotOptimize(static_cast<int>(s.code));
        benchmark::DoNotOptimize(out);
    }
}
} // namespace

// 64 bytes is an Ed25519 signature, 512 an RSA-4096 one.
static void BM_DeriveKeySha256(benchmark::State& state) {
    run_derive_key(state, touchseal::security::HashId::Sha256);
}
BENCHMARK(BM_DeriveKeySha256)->Arg(64)->Arg(72)->Arg(512);

static void BM_DeriveKeyBlake3(benchmark::State& state) {
    run_derive_key(state, touchseal::security::HashId::Blake3);
}
BENCHMARK(BM_DeriveKeyBlake3)->Arg(64)->Arg(72)->Arg(512);

static void BM_DeriveMacKey(benchmark::State& state) {
    touchseal::security::Key256 key{};
    for (size_t i = 0; i < 32; ++i) {
        key.b[i] = static_cast<touchseal::core::u8>(i + 7);
    }

    for (auto _ : state) {
        touchseal::security::Key256 out{};
        const touchseal::core::Status s = touchseal::security::derive_mac_key(key, &out);
        benchmark::DoNotOptimize(static_cast<int>(s.code));
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DeriveMacKey);
