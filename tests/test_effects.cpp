#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <f1live/effects.hpp>

using Catch::Approx;
using namespace f1live;
using ms = std::chrono::milliseconds;

TEST_CASE("Effects report progress while running") {
  EffectScheduler fx;
  const EffectScheduler::Clock::time_point t0{};
  fx.schedule("flash", t0, ms{1000});

  REQUIRE(fx.progress("flash", t0).value() == Approx(0.0));
  REQUIRE(fx.progress("flash", t0 + ms{250}).value() == Approx(0.25));
  REQUIRE_FALSE(fx.progress("flash", t0 + ms{1000}).has_value());
  REQUIRE_FALSE(fx.progress("other", t0).has_value());
}

TEST_CASE("Delayed effects are pending until they start") {
  EffectScheduler fx;
  const EffectScheduler::Clock::time_point t0{};
  fx.schedule("banner", t0, ms{500}, ms{200});
  REQUIRE_FALSE(fx.active("banner", t0 + ms{100}));
  REQUIRE(fx.active("banner", t0 + ms{200}));
  REQUIRE(fx.progress("banner", t0 + ms{450}).value() == Approx(0.5));
}

TEST_CASE("Rescheduling a name restarts it") {
  EffectScheduler fx;
  const EffectScheduler::Clock::time_point t0{};
  fx.schedule("pulse", t0, ms{1000});
  fx.schedule("pulse", t0 + ms{800}, ms{1000});
  REQUIRE(fx.size() == 1);
  REQUIRE(fx.progress("pulse", t0 + ms{900}).value() == Approx(0.1));
}

TEST_CASE("Effects can be cancelled and expire") {
  EffectScheduler fx;
  const EffectScheduler::Clock::time_point t0{};
  const auto a = fx.schedule("a", t0, ms{100});
  fx.schedule("b", t0, ms{100});
  fx.schedule("c", t0, ms{5000});

  REQUIRE(fx.cancel(a));
  REQUIRE_FALSE(fx.cancel(a));
  fx.cancel(std::string("b"));
  REQUIRE(fx.size() == 1);

  fx.schedule("d", t0, ms{100});
  fx.expire(t0 + ms{200});
  REQUIRE(fx.size() == 1);
  REQUIRE(fx.active("c", t0 + ms{200}));

  fx.cancel_all();
  REQUIRE(fx.size() == 0);
}
