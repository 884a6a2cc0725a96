/** @file

  cdnstrip: drop the addresses of a target list that sit behind a CDN.

  @section license License

  Licensed to the Apache Software Foundation (ASF) under one
  or more contributor license agreements.  See the NOTICE file
  distributed with this work for additional information
  regarding copyright ownership.  The ASF licenses this file
  to you under the Apache License, Version 2.0 (the
  "License"); you may not use this file except in compliance
  with the License.  You may obtain a copy of the License at

      http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
 */

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "cdnstrip/ArgParser.h"
#include "cdnstrip/Config.h"
#include "cdnstrip/Diags.h"
#include "cdnstrip/ErrataUtil.h"
#include "cdnstrip/Pipeline.h"
#include "cdnstrip/Progress.h"
#include "cdnstrip/RangeSource.h"
#include "cdnstrip/Sink.h"

using namespace cdnstrip;

namespace
{
DbgCtl dbg_ctl{"cdnstrip"};

// Global so the fatal cleanup can reach it.
Progress *progress_display = nullptr;

void
stop_progress()
{
  if (progress_display) {
    progress_display->stop();
  }
}

Config config;

RangeSetPtr
load_ranges(Progress &progress)
{
  auto cache_path = config.cache_file();
  if (!cache_path.is_ok()) {
    fatal_errata("cache_file", cache_path.errata());
  }
  RangeCache cache{cache_path.result()};
  auto       providers = config.providers();

  auto ranges = obtain_ranges(cache, config.skip_cache, providers, [&](std::string_view text) { progress.status(text); });
  if (!ranges.is_ok()) {
    fatal_errata("load_ranges", ranges.errata());
  }
  log_errata(ranges.errata());
  return ranges.result();
}

int exit_status = EXIT_SUCCESS;

void
strip_command()
{
  Progress progress{stderr, config.progress};
  progress_display = &progress;
  progress.start();

  RangeSetPtr ranges = load_ranges(progress);
  Dbg(dbg_ctl, "%zu CDN ranges loaded", ranges->size());

  FileSource source;
  FileSink   sink{config.raw ? OutputMode::Raw : OutputMode::Canonical};
  if (auto errata = open_run_files(source, config.input, sink, config.output); !errata.is_ok()) {
    fatal_errata("open_files", errata);
  }

  Aggregator aggregator{sink};
  Pipeline   pipeline{ranges, InputNormalizer{config.ipv6}, aggregator, config.threads, config.queue_depth};

  progress.watch(aggregator);
  auto run = pipeline.run(source.stream());
  if (!run.is_ok()) {
    fatal_errata("start_workers", run.errata());
  }
  auto const &stats = run.result();
  sink.flush();
  progress.stop();
  progress_display = nullptr;

  auto counters = aggregator.counters();
  Note("%" PRIu64 " lines read, %" PRIu64 " addresses classified: %" PRIu64 " valid, %" PRIu64 " invalid, %" PRIu64 " cdn",
       stats.lines, stats.tasks, counters.valid, counters.invalid, counters.matched);

  if (sink.failed()) {
    Error("output to '%s' is incomplete", sink.path().c_str());
    exit_status = EXIT_FAILURE;
  }
}

void
ranges_command()
{
  Progress progress{stderr, false};
  RangeSetPtr ranges = load_ranges(progress);
  for (auto const &literal : ranges->literals()) {
    std::cout << literal << '\n';
  }
  std::cout.flush();
  if (!std::cout) {
    Error("unable to write the range list");
    exit_status = EXIT_FAILURE;
  }
}
} // namespace

int
main(int /* argc */, const char **argv)
{
  ArgParser parser;
  parser.add_global_usage("cdnstrip [COMMAND] [OPTIONS]");
  parser.add_description("Remove addresses served through a CDN or reverse proxy from a list of targets.");
  parser.add_option("--help", "-h", "Print usage information");
  parser.add_option("--version", "-V", "Print version string");
  parser.add_option("--threads", "-t", "Number of classification threads", "CDNSTRIP_THREADS", 1);
  parser.add_option("--input", "-i", "Input file, '-' for standard input", "", 1, "-");
  parser.add_option("--output", "-o", "Output file, '-' for standard output", "", 1, "-");
  parser.add_option("--raw", "-r", "Write the original input line instead of the address");
  parser.add_option("--skip-cache", "-s", "Ignore the range cache, acquire the ranges and rewrite it");
  parser.add_option("--ipv6", "-k", "Also check IPv6 addresses");
  parser.add_option("--config", "-c", "YAML configuration file", "CDNSTRIP_CONFIG", 1);
  parser.add_option("--cache-file", "", "Range cache location", "CDNSTRIP_CACHE", 1);
  parser.add_option("--ranges", "", "Additional file of CDN range literals", "", 1);
  parser.add_option("--quiet", "-q", "Do not display progress");
  parser.add_option("--debug-tags", "-T", "Activate debug tags, separated by '|'", "", 1);

  parser.add_command("strip", "Drop CDN addresses from the input (default)", &strip_command)
    .add_example_usage("cdnstrip -i targets.txt -o filtered.txt -t 8")
    .add_example_usage("cat targets.txt | cdnstrip --raw > filtered.txt");
  parser.add_command("ranges", "Print the CDN ranges in use", &ranges_command).add_example_usage("cdnstrip ranges --skip-cache");
  parser.set_default_command("strip");

  Arguments args = parser.parse(argv);

  DiagsPtr::set(new Diags("cdnstrip", ""));
  diags()->cleanup_func = &stop_progress;

  auto config_file = args.get("config");
  if (std::string path = config_file ? config_file.value() : config_file.env(); !path.empty()) {
    if (auto errata = config.load(expand_home(path)); !errata.is_ok()) {
      fatal_errata("load_config", errata);
    }
  }
  if (auto errata = config.apply(args); !errata.is_ok()) {
    parser.help_message(errata_text(errata));
  }
  if (!config.debug_tags.empty()) {
    diags()->activate_taglist(config.debug_tags.c_str());
  }

  if (!args.has_action()) {
    parser.help_message("no command given");
  }
  args.invoke();
  return exit_status;
}
