#include <benchmark/benchmark.h>
#include "veilmarket/core/log.hpp"
#include "veilmarket/crypto/coprocessor.hpp"
#include "veilmarket/crypto/encrypted_input.hpp"

using namespace veilmarket;
using namespace veilmarket::crypto;

namespace {

Address tagged(uint8_t tag) {
    Address a{};
    a[19] = tag;
    return a;
}

CoprocessorConfig seeded_config() {
    CoprocessorConfig config;
    config.key_seed = {'b', 'e', 'n', 'c', 'h'};
    return config;
}

} // anonymous namespace

// ============================================================================
// Encryption Benchmarks
// ============================================================================

static void BM_EncryptBundle(benchmark::State& state) {
    log::set_threshold(log::Level::Off);
    Coprocessor coprocessor(seeded_config());
    const size_t values = static_cast<size_t>(state.range(0));

    for (auto _ : state) {
        EncryptedInput input(coprocessor, tagged(0x10), tagged(0xA1));
        for (size_t i = 0; i < values; ++i) {
            input.add64(i * 1'000);
        }
        auto bundle = input.encrypt();
        benchmark::DoNotOptimize(bundle);
    }

    state.SetItemsProcessed(state.iterations() * values);
}
BENCHMARK(BM_EncryptBundle)->Arg(1)->Arg(3)->Arg(16)->Arg(255);

// ============================================================================
// Verification Benchmarks
// ============================================================================

static void BM_VerifyInput(benchmark::State& state) {
    log::set_threshold(log::Level::Off);
    Coprocessor coprocessor(seeded_config());
    const size_t values = static_cast<size_t>(state.range(0));

    EncryptedInput input(coprocessor, tagged(0x10), tagged(0xA1));
    for (size_t i = 0; i < values; ++i) {
        input.add32(i);
    }
    auto bundle = input.encrypt();

    for (auto _ : state) {
        coprocessor.verify_input(tagged(0x10), tagged(0xA1), bundle.handles.back(),
                                 FheType::Uint32, bundle.proof);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * bundle.proof.size());
}
BENCHMARK(BM_VerifyInput)->Arg(3)->Arg(64)->Arg(255);

static void BM_PublicDecryptAndVerify(benchmark::State& state) {
    log::set_threshold(log::Level::Off);
    Coprocessor coprocessor(seeded_config());

    std::vector<Handle> handles;
    for (uint64_t v : {120ULL, 5ULL}) {
        Handle h = coprocessor.trivial_encrypt(v, FheType::Uint64);
        coprocessor.allow(h, tagged(0x10));
        coprocessor.make_publicly_decryptable(h, tagged(0x10));
        handles.push_back(h);
    }

    for (auto _ : state) {
        auto result = coprocessor.public_decrypt(handles);
        bool ok = coprocessor.verify_decryption(handles, result.cleartexts,
                                                result.decryption_proof);
        benchmark::DoNotOptimize(ok);
    }

    state.SetItemsProcessed(state.iterations() * handles.size());
}
BENCHMARK(BM_PublicDecryptAndVerify);

BENCHMARK_MAIN();
