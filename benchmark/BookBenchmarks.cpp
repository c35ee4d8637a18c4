/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "lobsim/book/Book.hpp"
#include "lobsim/simulation/Simulation.hpp"

#include <random>

//-------------------------------------------------------------------------

using namespace lobsim;

static const fs::path kTestDataPath{
    fs::path{__FILE__}.parent_path().parent_path() / "test" / "cpp-tests" / "data"};

static std::shared_ptr<spdlog::logger> quietLogger()
{
    auto logger = std::make_shared<spdlog::logger>("bench");
    logger->set_level(spdlog::level::off);
    return logger;
}

//-------------------------------------------------------------------------

struct BookFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        book = std::make_unique<book::Book>(book::BookConfig{}, quietLogger());
        rng.seed(17);
        depth = state.range(0);
    }

    void TearDown(benchmark::State&) override { book.reset(); }

    void fill(Timestep timestep)
    {
        std::uniform_int_distribution<int> ticks{1, 200};
        std::uniform_int_distribution<Quantity> volume{1, 50};
        for (int64_t i = 0; i < depth; ++i) {
            const bool buy = i % 2 == 0;
            const auto offset = util::double2price(ticks(rng) * 0.01);
            book->submitOrder(book->orderFactory().makeLimitOrder(
                0,
                buy ? book::OrderDirection::BUY : book::OrderDirection::SELL,
                volume(rng),
                buy ? DEC(100.0) - offset : DEC(100.0) + offset,
                timestep,
                5));
        }
    }

    std::unique_ptr<book::Book> book;
    std::mt19937 rng;
    int64_t depth{};
};

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(BookFixture, FillAndSweep)(benchmark::State& state)
{
    Timestep timestep{};
    for (auto _ : state) {
        fill(timestep);
        for (auto direction : {book::OrderDirection::BUY, book::OrderDirection::SELL}) {
            book->submitOrder(book->orderFactory().makeMarketOrder(
                1, direction, depth * 10, std::nullopt, timestep));
        }
        benchmark::DoNotOptimize(book->snapshot());
        book->reset();
        ++timestep;
    }
}
BENCHMARK_REGISTER_F(BookFixture, FillAndSweep)->Arg(100)->Arg(1000)->Arg(10000);

BENCHMARK_DEFINE_F(BookFixture, ReapTimeouts)(benchmark::State& state)
{
    Timestep timestep{};
    for (auto _ : state) {
        fill(timestep);
        benchmark::DoNotOptimize(book->cancelTimedOutOrders(timestep + 6));
        timestep += 7;
    }
}
BENCHMARK_REGISTER_F(BookFixture, ReapTimeouts)->Arg(1000)->Arg(10000);

//-------------------------------------------------------------------------

static void SimulationRun(benchmark::State& state)
{
    for (auto _ : state) {
        auto simulation =
            simulation::Simulation::fromConfig(kTestDataPath / "simulation.xml", quietLogger());
        simulation->simulate();
        benchmark::DoNotOptimize(simulation->lastPrice());
    }
}
BENCHMARK(SimulationRun)->Unit(benchmark::kMillisecond);

//-------------------------------------------------------------------------

BENCHMARK_MAIN();

//-------------------------------------------------------------------------
