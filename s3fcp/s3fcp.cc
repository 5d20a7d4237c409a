/**
 * This file is part of s3fcp.
 *
 * s3fcp copies a single object from S3 or an HTTP server to stdout or to a
 * file, fetching byte ranges of the object in parallel.
 */

#include <getopt.h>
#include <signal.h>
#include <stdint.h>

#include <cstdio>
#include <string>
#include <vector>

#include "network/http_client.h"
#include "network/range_source.h"
#include "network/range_source_http.h"
#include "network/range_source_s3.h"
#include "network/sink_file.h"
#include "network/uri.h"
#include "object.h"
#include "options.h"
#include "pipeline/pipeline.h"
#include "pipeline/progress.h"
#include "settings.h"
#include "util/logging.h"
#include "util/pointer.h"
#include "util/string.h"

#ifndef S3FCP_VERSION
#define S3FCP_VERSION "unknown"
#endif

using namespace std;  // NOLINT

namespace {

const int kExitOk = 0;
const int kExitFailure = 1;
const int kExitUsage = 2;

enum LongOnlyOptions {
  kOptVersionId = 1000,
};

void Usage(const char *exe) {
  LogS3fcp(kLogS3fcp, kLogStderr,
    "s3fcp version %s\n"
    "Copies an object from S3 or an HTTP server, downloading byte ranges in "
    "parallel.\n\n"
    "Usage: %s [options] <s3://bucket/key | http(s)://url>\n\n"
    "Options:\n"
    "  --version-id <id>        S3 object version (default: latest)\n"
    "  -c, --concurrency <n>    number of parallel fetches (default: %u)\n"
    "  -s, --chunk-size <size>  bytes per range request, e.g. 8MB, 16MiB "
    "(default: 8MB)\n"
    "  -O, --output <file>      write to file instead of stdout\n"
    "  -o, --config <file>      read KEY=VALUE parameters from file\n"
    "  -q, --quiet              no progress output\n"
    "  -v, --verbose            report retries and transfer details\n"
    "  -V, --version            print the version and exit\n"
    "  -h, --help               print this help and exit\n\n"
    "Configuration parameters (config file or environment):\n"
    "  S3FCP_S3_ENDPOINT, S3FCP_S3_REGION, S3FCP_S3_ACCESS_KEY,\n"
    "  S3FCP_S3_SECRET_KEY, S3FCP_S3_SESSION_TOKEN, S3FCP_S3_DNS_BUCKETS,\n"
    "  S3FCP_MAX_ATTEMPTS, S3FCP_BACKOFF_INIT_MS, S3FCP_BACKOFF_MAX_MS,\n"
    "  S3FCP_BACKOFF_MULTIPLIER, S3FCP_TIMEOUT, S3FCP_LOW_SPEED_LIMIT,\n"
    "  S3FCP_CONCURRENCY, S3FCP_CHUNK_SIZE, S3FCP_DEBUGLOG\n"
    "AWS_REGION, AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and "
    "AWS_SESSION_TOKEN are used as fallbacks.",
    S3FCP_VERSION, exe, s3fcp::Pipeline::kDefaultConcurrency);
}

}  // anonymous namespace


int main(int argc, char **argv) {
  DefaultLogging::Set(kLogStderr, kLogStderr);

  string version_id;
  string config_file;
  string output_path;
  string arg_concurrency;
  string arg_chunk_size;
  bool quiet = false;
  bool verbose = false;

  static struct option long_options[] = {
    {"version-id",  required_argument, NULL, kOptVersionId},
    {"concurrency", required_argument, NULL, 'c'},
    {"chunk-size",  required_argument, NULL, 's'},
    {"output",      required_argument, NULL, 'O'},
    {"config",      required_argument, NULL, 'o'},
    {"quiet",       no_argument,       NULL, 'q'},
    {"verbose",     no_argument,       NULL, 'v'},
    {"version",     no_argument,       NULL, 'V'},
    {"help",        no_argument,       NULL, 'h'},
    {NULL, 0, NULL, 0}
  };

  int c;
  while ((c = getopt_long(argc, argv, "c:s:O:o:qvVh", long_options, NULL))
         != -1)
  {
    switch (c) {
      case kOptVersionId:
        version_id = optarg;
        break;
      case 'c':
        arg_concurrency = optarg;
        break;
      case 's':
        arg_chunk_size = optarg;
        break;
      case 'O':
        output_path = optarg;
        break;
      case 'o':
        config_file = optarg;
        break;
      case 'q':
        quiet = true;
        break;
      case 'v':
        verbose = true;
        break;
      case 'V':
        LogS3fcp(kLogS3fcp, kLogStdout, "s3fcp version %s", S3FCP_VERSION);
        return kExitOk;
      case 'h':
        Usage(argv[0]);
        return kExitOk;
      case '?':
      default:
        Usage(argv[0]);
        return kExitUsage;
    }
  }
  if (optind != argc - 1) {
    PrintError("expected exactly one source (see --help)");
    return kExitUsage;
  }
  const string source_uri = argv[optind];
  if (verbose)
    SetLogVerbosity(kLogVerbose);

  SimpleOptionsParser options;
  if (!config_file.empty() && !options.TryParsePath(config_file)) {
    PrintError("cannot read configuration file " + config_file);
    return kExitUsage;
  }
  vector<string> env_prefixes;
  env_prefixes.push_back("S3FCP_");
  env_prefixes.push_back("AWS_");
  options.ParseEnvironment(env_prefixes);
  string debug_log;
  if (options.GetValue("S3FCP_DEBUGLOG", &debug_log))
    SetLogDebugFile(debug_log);
  LogS3fcp(kLogS3fcp, kLogDebug, "configuration:\n%s",
           options.Dump().c_str());

  s3fcp::Settings settings;
  string error;
  if (!s3fcp::LoadSettings(&options, &settings, &error)) {
    PrintError(error);
    return kExitUsage;
  }

  if (!arg_concurrency.empty()) {
    uint64_t concurrency;
    if (!String2Uint64Parse(arg_concurrency, &concurrency) ||
        (concurrency == 0) ||
        (concurrency > s3fcp::Pipeline::kMaxConcurrency))
    {
      PrintError("invalid concurrency: " + arg_concurrency);
      return kExitUsage;
    }
    settings.concurrency = concurrency;
    settings.http.pool_max_handles = concurrency;
  }
  if (!arg_chunk_size.empty()) {
    uint64_t chunk_size;
    if (!ParseByteSize(arg_chunk_size, &chunk_size) || (chunk_size == 0)) {
      PrintError("invalid chunk size: " + arg_chunk_size);
      return kExitUsage;
    }
    settings.chunk_size = chunk_size;
  }

  s3fcp::ObjectDescriptor descriptor;
  if (s3fcp::ParseSourceUri(source_uri, &descriptor) != download::kFailOk) {
    PrintError("invalid source " + source_uri +
               " (expected s3://bucket/key or http(s)://...)");
    return kExitUsage;
  }
  if (!version_id.empty()) {
    if (descriptor.backend != s3fcp::kBackendS3) {
      PrintError("--version-id requires an s3:// source");
      return kExitUsage;
    }
    descriptor.version_id = version_id;
  }

  // Write errors on a closed pipe are reported as I/O failures
  signal(SIGPIPE, SIG_IGN);

  download::HttpClient http_client(settings.http);
  UniquePtr<s3fcp::RangeSource> source;
  if (descriptor.backend == s3fcp::kBackendS3)
    source = new s3fcp::S3RangeSource(settings.s3, &http_client);
  else
    source = new s3fcp::HttpRangeSource(&http_client);

  s3fcp::Pipeline pipeline(source.weak_ref(), settings.retry,
                           settings.concurrency, settings.chunk_size);
  download::Failures retval = pipeline.Probe(&descriptor);
  if (retval != download::kFailOk) {
    PrintError(descriptor.Describe() + ": " + download::Code2Ascii(retval));
    return kExitFailure;
  }
  LogS3fcp(kLogS3fcp, kLogVerboseMsg, "%s: %s, %s",
           descriptor.Describe().c_str(),
           FormatByteSize(descriptor.size).c_str(),
           descriptor.supports_ranges ? "ranged download" :
                                        "no range support, single request");

  FILE *output_file = stdout;
  if (!output_path.empty()) {
    output_file = fopen(output_path.c_str(), "w");
    if (output_file == NULL) {
      PrintError("cannot open " + output_path + " for writing");
      return kExitFailure;
    }
  }
  s3fcp::FileSink output(output_file, output_file != stdout,
                         output_path.empty() ? "stdout" : output_path);

  UniquePtr<s3fcp::ProgressSink> progress;
  if (quiet)
    progress = new s3fcp::NullProgress();
  else
    progress = new s3fcp::StderrProgress(descriptor.size);

  const s3fcp::PipelineResult result =
    pipeline.Run(descriptor, &output, progress.weak_ref());
  if (!result.IsOk()) {
    if (!quiet) {
      // Terminate the progress line
      LogS3fcp(kLogS3fcp, kLogStderr, "%s", "");
    }
    PrintError(result.message + " (" + StringifyUint(result.bytes_written) +
               " bytes written, output incomplete)");
    return kExitFailure;
  }
  progress->Finish();
  return kExitOk;
}
