#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <set>

#include "engine/async_filter.hpp"
#include "engine/eval_event_service.hpp"
#include "engine/eval_service.hpp"
#include "engine/worker_pool.hpp"
#include "filter/builtin.hpp"
#include "filter/compose.hpp"
#include "filter/kernel.hpp"
#include "test_utils.hpp"

using pw::AsyncFilter;
using pw::AsyncMode;
using pw::AsyncStatus;
using pw::Color;
using pw::DataType;
using pw::FilterPtr;
using pw::Image;
using pw::make_filter;

namespace {

FilterPtr blur_then_saturate() {
  pw::Kernel k = pw::Kernel::gaussian_5x5();
  k.set_edge_strategy(pw::EdgeStrategy::Mirror);
  return pw::then(pw::then(make_filter<pw::Invert>(), make_filter<pw::Kernel>(std::move(k))),
                  make_filter<pw::Saturation>(1.5));
}

// 在指定行抛出异常，用于检查工作线程的异常传递
class ThrowOnRow : public pw::Filter {
 public:
  explicit ThrowOnRow(int row) : row_(row) {}
  void compute_at(const pw::Point& pt, const pw::Input& input, pw::Pixel& dest) const override {
    if (pt.y == row_) throw pw::FilterError(pw::FilterErrc::Unknown, "row " + std::to_string(row_));
    input.get_pixel(pt).convert_to(dest);
  }
  std::string name() const override { return "throw_on_row"; }

 private:
  int row_;
};

// 记录每次 before_compute 调用
class CountingFilter : public pw::PointFilter {
 public:
  void compute_pixel(const pw::Pixel& src, pw::Pixel& dest) const override { src.convert_to(dest); }
  void before_compute(pw::Input&, const Image&) const override { ++prepared; }
  std::string name() const override { return "counting"; }
  mutable int prepared = 0;
};

}  // namespace

TEST(EvalServiceTest, PartialEvaluationStaysInsideRegion) {
  Image src = pw_test::random_image(6, 6, Color::Gray);
  Image out(6, 6, Color::Gray, DataType::FLOAT64);
  pw::Invert invert;
  pw::EvalService().eval_partial(invert, {&src}, out, pw::Region(4, 4, 5, 5));

  EXPECT_DOUBLE_EQ(out.get_f(5, 5, 0), 1.0 - src.get_f(5, 5, 0));
  EXPECT_DOUBLE_EQ(out.get_f(4, 4, 0), 1.0 - src.get_f(4, 4, 0));
  EXPECT_DOUBLE_EQ(out.get_f(3, 4, 0), 0.0);
  EXPECT_DOUBLE_EQ(out.get_f(0, 0, 0), 0.0);
}

TEST(EvalServiceTest, InPlaceMatchesOutOfPlace) {
  Image src = pw_test::random_image(7, 5, Color::Rgb, DataType::UINT8);
  pw::Contrast contrast(1.3);
  pw::EvalService svc;

  Image out = src.new_like();
  svc.eval(contrast, {&src}, out);

  Image in_place = src.clone();
  svc.eval_in_place(contrast, in_place);
  EXPECT_TRUE(pw_test::images_bit_equal(out, in_place));
}

TEST(EvalServiceTest, ParallelIsBitIdenticalToSequential) {
  Image src = pw_test::random_image(37, 23, Color::Rgb, DataType::FLOAT32);
  FilterPtr f = blur_then_saturate();

  Image sequential = src.new_like();
  pw::EvalService().eval(*f, {&src}, sequential);

  for (int rows_per_task : {0, 1, 3, 50}) {
    pw::WorkerPool pool(4);
    pool.start();
    pw::EvalOptions opts;
    opts.rows_per_task = rows_per_task;
    pw::EvalService svc(&pool, nullptr, opts);

    Image parallel = src.new_like();
    svc.eval_parallel(*f, {&src}, parallel);
    EXPECT_TRUE(pw_test::images_bit_equal(sequential, parallel)) << "rows_per_task=" << rows_per_task;
    pool.stop();
  }
}

TEST(EvalServiceTest, ParallelRethrowsWorkerException) {
  Image src = pw_test::random_image(4, 12, Color::Gray);
  Image out = src.new_like();
  pw::WorkerPool pool(3);
  pool.start();
  pw::EvalOptions opts;
  opts.rows_per_task = 2;
  pw::EvalService svc(&pool, nullptr, opts);

  ThrowOnRow bad(7);
  EXPECT_THROW(svc.eval_parallel(bad, {&src}, out), pw::FilterError);
  // 其他分带仍然完成
  EXPECT_DOUBLE_EQ(out.get_f(0, 0, 0), src.get_f(0, 0, 0));
  EXPECT_DOUBLE_EQ(out.get_f(3, 11, 0), src.get_f(3, 11, 0));
}

TEST(EvalServiceTest, ParallelWithoutPoolThrows) {
  Image src = pw_test::random_image(2, 2, Color::Gray);
  Image out = src.new_like();
  pw::Invert invert;
  EXPECT_THROW(pw::EvalService().eval_parallel(invert, {&src}, out), pw::FilterError);

  pw::WorkerPool stopped(1);
  EXPECT_THROW(pw::EvalService(&stopped).eval_parallel(invert, {&src}, out), pw::FilterError);
}

TEST(EvalServiceTest, BeforeComputeRunsOncePerStrategy) {
  Image src = pw_test::random_image(5, 9, Color::Gray);
  Image out = src.new_like();
  CountingFilter counting;
  pw::WorkerPool pool(2);
  pool.start();
  pw::EvalOptions opts;
  opts.rows_per_task = 1;
  pw::EvalService svc(&pool, nullptr, opts);

  svc.eval(counting, {&src}, out);
  EXPECT_EQ(counting.prepared, 1);
  svc.eval_parallel(counting, {&src}, out);
  EXPECT_EQ(counting.prepared, 2);
  svc.eval_in_place(counting, out);
  EXPECT_EQ(counting.prepared, 3);
  svc.to_async(counting, {&src}, out).run();
  EXPECT_EQ(counting.prepared, 4);
}

TEST(AsyncFilterTest, PixelModeTakesOneStepPerPixel) {
  Image src = pw_test::random_image(5, 4, Color::Rgb);
  Image out = src.new_like();
  pw::Invert invert;
  AsyncFilter task(invert, AsyncMode::Pixel, {&src}, out);

  int pending = 0;
  int ready = 0;
  while (!task.done()) {
    if (task.step() == AsyncStatus::Pending) {
      ++pending;
    } else {
      ++ready;
    }
  }
  EXPECT_EQ(pending, 5 * 4 - 1);
  EXPECT_EQ(ready, 1);
  EXPECT_EQ(task.steps(), 20u);
  EXPECT_EQ(task.cursor(), pw::Point(0, 4));

  try {
    task.step();
    FAIL() << "step() after completion succeeded";
  } catch (const pw::FilterError& e) {
    EXPECT_EQ(e.code(), pw::FilterErrc::InvalidParameter);
  }
}

TEST(AsyncFilterTest, RowModeTakesOneStepPerRow) {
  Image src = pw_test::random_image(5, 4, Color::Rgb);
  Image out = src.new_like();
  pw::Invert invert;
  AsyncFilter task(invert, AsyncMode::Row, {&src}, out);

  EXPECT_EQ(task.step(), AsyncStatus::Pending);
  EXPECT_EQ(task.cursor(), pw::Point(0, 1));
  // 游标以下的行尚未被写入
  EXPECT_DOUBLE_EQ(out.get_f(2, 0, 1), 1.0 - src.get_f(2, 0, 1));
  EXPECT_DOUBLE_EQ(out.get_f(2, 1, 1), 0.0);

  task.run();
  EXPECT_TRUE(task.done());
  EXPECT_EQ(task.steps(), 4u);
  EXPECT_THROW(task.step(), pw::FilterError);
}

TEST(AsyncFilterTest, EmptyOutputIsReadyImmediately) {
  Image src(0, 0, Color::Gray);
  Image out(0, 0, Color::Gray);
  pw::Invert invert;
  AsyncFilter task(invert, AsyncMode::Row, {&src}, out);
  EXPECT_EQ(task.step(), AsyncStatus::Ready);
  EXPECT_EQ(task.steps(), 0u);
}

TEST(AsyncFilterTest, MatchesFullEvaluationAndSurvivesMove) {
  Image src = pw_test::random_image(9, 6, Color::Rgb);
  FilterPtr f = blur_then_saturate();
  pw::EvalService svc;

  Image expected = src.new_like();
  svc.eval(*f, {&src}, expected);

  Image out = src.new_like();
  AsyncFilter first = svc.to_async(*f, {&src}, out, AsyncMode::Pixel);
  first.step();
  AsyncFilter moved = std::move(first);
  moved.run();
  pw_test::expect_images_near(out, expected, 0.0);
}

TEST(AsyncFilterTest, ModeNames) {
  EXPECT_STREQ(pw::async_mode_name(AsyncMode::Pixel), "pixel");
  EXPECT_EQ(pw::async_mode_from_name("row").value_or(AsyncMode::Pixel), AsyncMode::Row);
  EXPECT_FALSE(pw::async_mode_from_name("tile").has_value());
}

TEST(AsyncFilterTest, EvalAsyncOnPool) {
  Image src = pw_test::random_image(11, 13, Color::Rgb, DataType::FLOAT32);
  FilterPtr f = blur_then_saturate();

  Image expected = src.new_like();
  pw::EvalService().eval(*f, {&src}, expected);

  pw::WorkerPool pool(2);
  pool.start();
  pw::EvalEventService events;
  pw::EvalService svc(&pool, &events);

  Image by_row = src.new_like();
  Image by_pixel = src.new_like();
  auto row_done = svc.eval_async(f, {&src}, by_row, AsyncMode::Row);
  auto pixel_done = svc.eval_async(f, {&src}, by_pixel, AsyncMode::Pixel);
  row_done.get();
  pixel_done.get();

  EXPECT_TRUE(pw_test::images_bit_equal(expected, by_row));
  EXPECT_TRUE(pw_test::images_bit_equal(expected, by_pixel));

  auto log = events.drain();
  ASSERT_EQ(log.size(), 2u);
  std::set<std::string> strategies;
  for (const auto& e : log) strategies.insert(e.strategy);
  EXPECT_EQ(strategies, (std::set<std::string>{"async_row", "async_pixel"}));
  EXPECT_EQ(events.size(), 0u);
}

TEST(AsyncFilterTest, EvalAsyncForwardsErrorsThroughFuture) {
  Image src = pw_test::random_image(3, 5, Color::Gray);
  Image out = src.new_like();
  pw::WorkerPool pool(1);
  pool.start();
  pw::EvalService svc(&pool);

  auto done = svc.eval_async(std::make_shared<ThrowOnRow>(2), {&src}, out);
  EXPECT_THROW(done.get(), pw::FilterError);
  EXPECT_DOUBLE_EQ(out.get_f(1, 1, 0), src.get_f(1, 1, 0));

  pool.stop();
  EXPECT_THROW(svc.eval_async(make_filter<pw::Invert>(), {&src}, out), pw::FilterError);
}

TEST(WorkerPoolTest, PostReturnsResultsAndDrainsOnStop) {
  pw::WorkerPool pool(3);
  EXPECT_EQ(pool.size(), 3u);
  pool.start();
  std::vector<std::future<int>> results;
  for (int i = 0; i < 50; ++i) {
    results.push_back(pool.post([i] { return i * i; }));
  }
  auto worker = pool.post([] { return pw::WorkerPool::this_worker_id(); });
  pool.stop();
  for (int i = 0; i < 50; ++i) EXPECT_EQ(results[i].get(), i * i);
  const int id = worker.get();
  EXPECT_GE(id, 0);
  EXPECT_LT(id, 3);
  EXPECT_EQ(pw::WorkerPool::this_worker_id(), -1);
  EXPECT_THROW(pool.post([] { return 0; }), pw::FilterError);
}

TEST(EvalEventTest, EvalLogToJson) {
  Image src = pw_test::random_image(8, 8, Color::Rgb);
  Image out = src.new_like();
  pw::EvalEventService events;
  pw::EvalService svc(nullptr, &events);
  FilterPtr f = blur_then_saturate();

  svc.eval(*f, {&src}, out);
  svc.eval_partial(*f, {&src}, out, pw::Region(2, 2, 10, 3));

  auto log = events.drain();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].strategy, "full");
  EXPECT_EQ(log[0].filter, f->name());
  EXPECT_EQ(log[1].strategy, "partial");
  EXPECT_EQ(log[1].width, 6);
  EXPECT_EQ(log[1].height, 3);

  nlohmann::json j = nlohmann::json::array();
  for (const auto& e : log) {
    j.push_back({{"filter", e.filter},
                 {"strategy", e.strategy},
                 {"width", e.width},
                 {"height", e.height},
                 {"elapsed_ms", e.elapsed_ms}});
  }

  std::ofstream ofs("eval_log.json");
  ofs << std::setw(2) << j << std::endl;
  ofs.close();

  std::ifstream ifs("eval_log.json");
  ASSERT_TRUE(static_cast<bool>(ifs));
  nlohmann::json back = nlohmann::json::parse(ifs);
  ASSERT_EQ(back.size(), 2u);
  EXPECT_EQ(back[1]["strategy"], "partial");
  EXPECT_GE(back[0]["elapsed_ms"].get<double>(), 0.0);
}
