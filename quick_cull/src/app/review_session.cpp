//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "app/review_session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <istream>
#include <ostream>
#include <set>
#include <sstream>
#include <utility>

#include "decoders/regular_decoder.hpp"
#include "error/errors.hpp"

namespace quickcull {
namespace {
auto DecisionName(Decision decision) -> const char* {
  switch (decision) {
    case Decision::PENDING:
      return "pending";
    case Decision::KEPT:
      return "kept";
    case Decision::SKIPPED:
      return "skipped";
  }
  return "unknown";
}

constexpr const char* kHelp =
    "commands: n next, p previous, k keep, s skip, g <n> go to image n, r <row> scroll grid, "
    "i info, q quit";
}  // namespace

ReviewSession::ReviewSession(const std::filesystem::path& source,
                             const std::filesystem::path& destination, SessionConfig config,
                             std::shared_ptr<ImageDecoder> decoder)
    : config_(std::move(config)),
      index_(std::make_shared<ImageIndex>(ImageIndex::Build(source))),
      pool_(std::make_shared<ThreadPool>(static_cast<size_t>(config_.worker_threads_))),
      decoder_(decoder ? std::move(decoder) : std::make_shared<RegularDecoder>()) {
  ThumbnailCacheOptions grid_options;
  grid_options.decode_mode_       = DecodeMode::DRAFT;
  grid_options.max_entries_       = config_.memory_cache_entries_;
  grid_options.max_bytes_         = config_.memory_cache_bytes_;
  grid_options.disk_budget_bytes_ = config_.disk_cache_bytes_;
  grid_options.disk_dir_          = config_.cache_dir_;
  grid_cache_ = std::make_shared<ThumbnailCache>(decoder_, pool_, grid_options);
  grid_cache_->LoadPersisted(index_->Folder());

  // Full-size previews are large, they are bounded by count and never persisted
  ThumbnailCacheOptions preview_options;
  preview_options.decode_mode_ = DecodeMode::FULL;
  // Room for the whole window plus the reviewed image
  preview_options.max_entries_ = std::max<uint32_t>(
      config_.preview_cache_entries_, static_cast<uint32_t>(config_.preload_count_) + 1);
  preview_options.max_bytes_   = 0;
  preview_cache_ = std::make_shared<ThumbnailCache>(decoder_, pool_, preview_options);

  scheduler_ = std::make_unique<ViewportScheduler>(
      index_, grid_cache_, GridCanvas(config_.Layout(index_->Size())), config_.ThumbnailTarget());
  preloader_ = std::make_unique<BackgroundPreloader>(
      index_, preview_cache_, static_cast<size_t>(config_.preload_count_), config_.PreviewTarget());
  exporter_ = std::make_unique<KeepExportService>(index_, destination);

  spdlog::info("[ReviewSession] {} images in {}, keeping into {}", index_->Size(),
               index_->Folder().string(), destination.string());
}

ReviewSession::~ReviewSession() { Persist(); }

auto ReviewSession::WarmGrid(std::chrono::milliseconds page_timeout) -> size_t {
  const auto&          canvas = scheduler_->Canvas();
  const int            page   = std::max(canvas.Layout().viewport_height_, 1);
  std::set<image_id_t> loaded;
  for (int offset = 0; offset < std::max(canvas.ContentHeight(), 1); offset += page) {
    scheduler_->Update(canvas.ViewportAt(offset, config_.prefetch_margin_rows_));
    if (!scheduler_->WaitIdle(page_timeout)) {
      spdlog::warn("[ReviewSession] Grid page at offset {} did not finish in time", offset);
    }
    for (const auto identity : scheduler_->Tracked()) {
      if (scheduler_->StateOf(identity) == LoadState::LOADED) {
        loaded.insert(identity);
      }
    }
  }
  spdlog::info("[ReviewSession] Grid warm-up loaded {} of {} thumbnails", loaded.size(),
               index_->Size());
  return loaded.size();
}

void ReviewSession::ScrollGrid(int offset) {
  scheduler_->Update(scheduler_->Canvas().ViewportAt(offset, config_.prefetch_margin_rows_));
  scheduler_->Poll();
}

auto ReviewSession::Open(image_id_t identity) -> ThumbnailResult {
  if (!current_.has_value()) {
    preloader_->Enter(identity);
  } else {
    preloader_->Advance(identity);
  }
  current_ = identity;
  preloader_->Poll();
  return preloader_->Acquire(identity);
}

auto ReviewSession::Next() -> std::optional<image_id_t> {
  if (index_->Empty()) return std::nullopt;
  const image_id_t next = current_.has_value() ? *current_ + 1 : 0;
  if (!index_->Contains(next)) return std::nullopt;
  Open(next);
  return next;
}

auto ReviewSession::Previous() -> std::optional<image_id_t> {
  if (!current_.has_value() || *current_ == 0) return std::nullopt;
  const image_id_t previous = *current_ - 1;
  Open(previous);
  return previous;
}

auto ReviewSession::KeepCurrent() -> ExportResult {
  if (!current_.has_value()) {
    throw ExportError("[ERROR] ReviewSession: No image under review.");
  }
  return exporter_->Keep(*current_);
}

void ReviewSession::SkipCurrent() {
  if (current_.has_value()) {
    exporter_->Skip(*current_);
  }
}

void ReviewSession::Show(std::ostream& out) {
  if (!current_.has_value()) {
    out << "no image under review\n";
    return;
  }
  const auto& entry   = index_->Lookup(*current_);
  auto        preview = preloader_->Acquire(*current_);
  out << std::format("[{}/{}] {}  ", *current_ + 1, index_->Size(),
                     entry.path_.filename().string());
  if (preview.Ok()) {
    out << std::format("{}x{}", preview.bitmap_->Width(), preview.bitmap_->Height());
  } else {
    out << std::format("unreadable ({})", ToString(*preview.error_));
  }
  out << std::format("  {}\n", DecisionName(entry.decision_));
}

auto ReviewSession::Run(std::istream& in, std::ostream& out) -> int {
  if (index_->Empty()) {
    out << "no supported images found\n";
    return 0;
  }
  out << kHelp << "\n";
  Open(0);
  Show(out);

  std::string line;
  while (std::getline(in, line)) {
    std::istringstream words(line);
    std::string        command;
    words >> command;
    preloader_->Poll();
    scheduler_->Poll();

    if (command.empty()) {
      continue;
    } else if (command == "q" || command == "quit") {
      break;
    } else if (command == "n" || command == "next") {
      if (!Next()) out << "last image\n";
    } else if (command == "p" || command == "prev") {
      if (!Previous()) out << "first image\n";
    } else if (command == "k" || command == "keep") {
      try {
        auto result = KeepCurrent();
        out << (result.copied_ ? std::format("kept as {}\n", result.destination_.string())
                               : std::string("already kept\n"));
        Next();
      } catch (const ExportError& e) {
        out << e.what() << "\n";
      }
    } else if (command == "s" || command == "skip") {
      SkipCurrent();
      Next();
    } else if (command == "g" || command == "go") {
      size_t number = 0;
      if (!(words >> number) || number == 0 || number > index_->Size()) {
        out << std::format("expected an image number between 1 and {}\n", index_->Size());
        continue;
      }
      Open(static_cast<image_id_t>(number - 1));
    } else if (command == "r" || command == "row") {
      int row = 0;
      if (!(words >> row) || row < 0) {
        out << "expected a row number\n";
        continue;
      }
      ScrollGrid(row * scheduler_->Canvas().Layout().cell_height_);
      const auto rows = scheduler_->DesiredRows();
      out << std::format("grid rows [{}, {}), {} tracked, {} loading\n", rows.first_, rows.last_,
                         scheduler_->Tracked().size(), scheduler_->InFlightCount());
      continue;
    } else if (command == "i" || command == "info") {
      out << Summary() << "\n";
      continue;
    } else {
      out << kHelp << "\n";
      continue;
    }
    Show(out);
  }

  out << Summary() << "\n";
  return 0;
}

void ReviewSession::Persist() { grid_cache_->Persist(); }

auto ReviewSession::Summary() const -> std::string {
  const auto stats = grid_cache_->Stats();
  return std::format(
      "{} images: {} kept, {} skipped, {} pending | thumbnails: {} decoded, {} memory hits, {} "
      "disk hits, {} failed",
      index_->Size(), index_->CountByDecision(Decision::KEPT),
      index_->CountByDecision(Decision::SKIPPED), index_->CountByDecision(Decision::PENDING),
      stats.decodes_, stats.memory_hits_, stats.disk_hits_, stats.failures_);
}
};  // namespace quickcull
