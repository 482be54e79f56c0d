// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 droidglue Contributors
//
// Event Path Performance Benchmarks

#include <benchmark/benchmark.h>
#include "droidglue/channel.h"
#include "droidglue/host/headless_host.h"
#include "droidglue/input_translator.h"
#include "droidglue/subscriber_registry.h"
#include <vector>

using namespace droidglue;

// ═══════════════════════════════════════════════════════════════════════════
// Channel Benchmarks
// ═══════════════════════════════════════════════════════════════════════════

static void BM_ChannelSendRecv(benchmark::State& state) {
    auto [tx, rx] = make_event_channel();

    for (auto _ : state) {
        tx.send(events::PointerMoved{1, 2});
        benchmark::DoNotOptimize(rx.try_recv());
    }
}
BENCHMARK(BM_ChannelSendRecv);

// ═══════════════════════════════════════════════════════════════════════════
// Registry Benchmarks
// ═══════════════════════════════════════════════════════════════════════════

static void BM_RegistryPublish(benchmark::State& state) {
    SubscriberRegistry registry;
    std::vector<EventReceiver> receivers;
    for (int64_t i = 0; i < state.range(0); ++i) {
        auto [tx, rx] = make_event_channel();
        registry.subscribe(std::move(tx));
        receivers.push_back(std::move(rx));
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(registry.publish(events::PointerMoved{3, 4}));

        state.PauseTiming();
        for (auto& rx : receivers) {
            rx.try_recv();
        }
        state.ResumeTiming();
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_RegistryPublish)->Arg(1)->Arg(4)->Arg(16);

// ═══════════════════════════════════════════════════════════════════════════
// Input Translation Benchmarks
// ═══════════════════════════════════════════════════════════════════════════

static void BM_TranslateMove(benchmark::State& state) {
    SubscriberRegistry registry;
    auto [tx, rx] = make_event_channel(1);
    registry.subscribe(std::move(tx));
    host::RecordedMotion motion(host::motion::ActionMove, 100.0f, 200.0f);

    // Bounded channel stays full after the first event; measures the drop path too
    for (auto _ : state) {
        benchmark::DoNotOptimize(translate_input(motion, registry));
    }
}
BENCHMARK(BM_TranslateMove);

BENCHMARK_MAIN();
