/**
 * @file assembler.cpp
 * @brief Parallel per-frame rendering with ordered reassembly
 */

#include "engine/assembler.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <numeric>
#include <thread>

namespace MemeEngine {

namespace {

/// Joins every started worker on scope exit, including during unwinding
struct WorkerGroup {
  std::vector<std::thread> threads;

  WorkerGroup() = default;
  WorkerGroup(const WorkerGroup &) = delete;
  WorkerGroup &operator=(const WorkerGroup &) = delete;

  ~WorkerGroup() {
    for (auto &t : threads) {
      if (t.joinable()) {
        t.join();
      }
    }
  }
};

} // anonymous namespace

std::vector<uint32_t> spiral_order(uint32_t start, uint32_t length) {
  std::vector<uint32_t> order;
  order.reserve(length);

  int64_t forward = start;
  int64_t backward = static_cast<int64_t>(start) - 1;
  while (order.size() < length) {
    if (forward < length) {
      order.push_back(static_cast<uint32_t>(forward));
    }
    ++forward;
    if (backward >= 0 && backward < length) {
      order.push_back(static_cast<uint32_t>(backward));
    }
    --backward;
  }
  return order;
}

AnimationAssembler::AnimationAssembler(Text::FontLibrary &fonts,
                                       unsigned worker_threads,
                                       InterpolationDefaults defaults)
    : fonts_(fonts), compositor_(fonts), workers_(worker_threads),
      defaults_(defaults) {
  if (workers_ == 0) {
    workers_ = std::max(1u, std::thread::hardware_concurrency());
  }
}

void AnimationAssembler::check_inputs(const Template &tmpl,
                                      const Animation &base,
                                      std::span<const std::string> texts) const {
  if (texts.size() > tmpl.size()) {
    throw TextCountError(texts.size(), tmpl.size());
  }
  tmpl.validate_against(base);
  // Faces are loaded up front; workers only read them
  fonts_.prepare(tmpl);
}

ImageBuffer AnimationAssembler::render_frame(const Template &tmpl,
                                             const Animation &base,
                                             std::span<const std::string> texts,
                                             uint32_t index) const {
  check_inputs(tmpl, base, texts);
  if (index >= base.frame_count()) {
    throw ValidationError("Frame " + std::to_string(index) +
                          " is outside the animation (" +
                          std::to_string(base.frame_count()) + " frames)");
  }
  auto resolved = resolve_all(tmpl, index, defaults_);
  return compositor_.composite(base.frames[index].image, tmpl, resolved, texts);
}

Animation AnimationAssembler::render(const Template &tmpl, const Animation &base,
                                     std::span<const std::string> texts,
                                     const RenderOptions &options) const {
  check_inputs(tmpl, base, texts);

  const auto total = static_cast<uint32_t>(base.frame_count());
  std::vector<uint32_t> order;
  if (options.focus_frame) {
    order = spiral_order(std::min(*options.focus_frame, total - 1), total);
  } else {
    order.resize(total);
    std::iota(order.begin(), order.end(), 0u);
  }

  std::vector<ImageBuffer> slots(total);
  std::atomic<size_t> next{0};
  std::atomic<size_t> done{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;
  std::mutex progress_mutex;

  auto stop_requested = [&]() {
    return failed.load(std::memory_order_acquire) ||
           (options.cancel && options.cancel->cancelled());
  };

  auto worker = [&]() {
    while (!stop_requested()) {
      const size_t pos = next.fetch_add(1, std::memory_order_relaxed);
      if (pos >= order.size()) {
        break;
      }
      const uint32_t index = order[pos];
      try {
        auto resolved = resolve_all(tmpl, index, defaults_);
        slots[index] = compositor_.composite(base.frames[index].image, tmpl,
                                             resolved, texts);

        const size_t finished =
            done.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (options.progress) {
          std::lock_guard<std::mutex> lock(progress_mutex);
          options.progress(finished, total);
        }
      } catch (...) {
        // Caller's progress callback included; rethrown after join
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed.store(true, std::memory_order_release);
        break;
      }
    }
  };

  const unsigned thread_count =
      std::min<unsigned>(workers_, std::max<uint32_t>(total, 1));
  if (thread_count <= 1) {
    worker();
  } else {
    WorkerGroup group;
    group.threads.reserve(thread_count);
    try {
      for (unsigned i = 0; i < thread_count; ++i) {
        group.threads.emplace_back(worker);
      }
    } catch (...) {
      // Started workers stop and are joined by the group
      failed.store(true, std::memory_order_release);
      throw;
    }
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
  if (options.cancel && options.cancel->cancelled() &&
      done.load() < total) {
    throw RenderCancelled();
  }

  Animation out;
  out.width = base.width;
  out.height = base.height;
  out.loop_count = base.loop_count;
  out.frames.reserve(total);
  for (uint32_t i = 0; i < total; ++i) {
    out.frames.push_back(Frame{std::move(slots[i]),
                               base.frames[i].duration_ms});
  }
  return out;
}

} // namespace MemeEngine
