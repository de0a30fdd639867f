#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/ranking/ranking_export.hpp"
#include "internal/util/errors.hpp"

using research::service::RunService;

static void Usage() {
  std::cout << "Usage:\n"
            << "  researchctl [--config <file>] [--tenant <id>] create-run <name>\n"
            << "  researchctl [--config <file>] [--tenant <id>] add-source <run_id> <url|text|pdf|list|proposal> <value|@file>\n"
            << "  researchctl [--config <file>] [--tenant <id>] start <run_id>\n"
            << "  researchctl [--config <file>] [--tenant <id>] cancel <run_id>\n"
            << "  researchctl [--config <file>] [--tenant <id>] retry <run_id>\n"
            << "  researchctl [--config <file>] [--tenant <id>] status <run_id>\n"
            << "  researchctl [--config <file>] [--tenant <id>] events <run_id>\n"
            << "  researchctl [--config <file>] [--tenant <id>] ranked <run_id> [--format json|csv] [--min-score X]\n"
            << "                                             [--has-hq] [--has-ownership] [--has-industry]\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw research::util::InvalidArgument("cannot read " + path);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// "@path" reads the file, anything else is taken literally.
static std::string ValueOrFile(const std::string& value) {
  if (!value.empty() && value[0] == '@') {
    return ReadFile(value.substr(1));
  }
  return value;
}

static int RunCommand(RunService& service, const std::string& tenant, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "create-run") {
    if (args.size() < 2) return 1;
    auto run = service.CreateRun(tenant, args[1]);
    std::cout << run.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-source") {
    if (args.size() < 4) return 1;

    auto type = research::model::ParseSourceType(args[2]);
    if (!type) {
      std::cerr << "unsupported source type: " << args[2] << "\n";
      return 1;
    }

    research::service::SourceInput input;
    input.source_type = *type;
    switch (*type) {
      case research::model::SourceType::kUrl:
        input.url = args[3];
        break;
      case research::model::SourceType::kPdf:
        input.content_bytes = ReadFile(args[3][0] == '@' ? args[3].substr(1) : args[3]);
        input.mime_type     = "application/pdf";
        input.title         = args[3];
        break;
      default:
        input.content_text = ValueOrFile(args[3]);
        break;
    }

    auto doc = service.AttachSource(tenant, args[1], input);
    std::cout << doc.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start") {
    if (args.size() < 2) return 1;
    auto job = service.StartRun(tenant, args[1]);
    std::cout << "job=" << job.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (args.size() < 2) return 1;
    auto outcome = service.CancelRun(tenant, args[1]);
    std::cout << research::service::ToString(outcome) << "\n";
    return outcome == research::service::CancelOutcome::kNotFound ? 2 : 0;
  }

  // ------------------------------------------------------------

  if (cmd == "retry") {
    if (args.size() < 2) return 1;
    auto job = service.RetryRun(tenant, args[1]);
    std::cout << "job=" << job.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (args.size() < 2) return 1;
    auto run = service.GetRun(tenant, args[1]);
    std::cout << "run=" << run.id << " status=" << research::model::ToString(run.status);
    if (!run.last_error.empty()) std::cout << " error=\"" << run.last_error << "\"";
    std::cout << "\n";

    for (const auto& step : service.ListSteps(tenant, args[1])) {
      std::cout << "  " << step.step_order << " " << step.step_key << " status=" << research::model::ToString(step.status)
                << " attempts=" << step.attempt_count << "/" << step.max_attempts;
      if (!step.last_error.empty()) std::cout << " error=\"" << step.last_error << "\"";
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    if (args.size() < 2) return 1;
    for (const auto& event : service.ListEvents(tenant, args[1])) {
      std::cout << event.created_at_ms << " " << event.event_type << " " << research::model::ToString(event.status) << " " << event.input_json;
      if (!event.error_message.empty()) std::cout << " error=\"" << event.error_message << "\"";
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ranked") {
    if (args.size() < 2) return 1;

    std::string                      format = "json";
    research::ranking::RankingFilters filters;
    for (size_t i = 2; i < args.size(); ++i) {
      if (args[i] == "--format" && i + 1 < args.size()) {
        format = args[++i];
      } else if (args[i] == "--min-score" && i + 1 < args.size()) {
        char* end       = nullptr;
        const auto text = args[++i];
        const double v  = std::strtod(text.c_str(), &end);
        if (*end != '\0') {
          std::cerr << "invalid --min-score: " << text << "\n";
          return 1;
        }
        filters.min_score = v;
      } else if (args[i] == "--has-hq") {
        filters.has_hq = true;
      } else if (args[i] == "--has-ownership") {
        filters.has_ownership = true;
      } else if (args[i] == "--has-industry") {
        filters.has_industry = true;
      } else {
        return 1;
      }
    }
    if (format != "json" && format != "csv") {
      std::cerr << "unsupported format: " << format << "\n";
      return 1;
    }

    auto report = service.RankedProspects(tenant, args[1], filters);
    if (format == "csv") {
      std::cout << research::ranking::ToCsvExport(report);
    } else {
      std::cout << research::ranking::ToJsonExport(report) << "\n";
    }
    return 0;
  }

  return 1;
}

int main(int argc, char** argv) {
  std::string              config_path;
  std::string              tenant = "default";
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (args.empty() && arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (args.empty() && arg == "--tenant" && i + 1 < argc) {
      tenant = argv[++i];
    } else {
      args.push_back(arg);
    }
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  try {
    research::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = research::config::ConfigLoader::LoadFromYaml(config_path);
    } else {
      research::config::ResolveDefaults(config);
    }
    research::observability::InitializeLogging(config, research::observability::LogSink::kStderr);

    auto deps = research::factory::BuildRuntime(config);

    const int rc = RunCommand(*deps.run_service, tenant, args);
    if (rc == 1) {
      Usage();
    }
    research::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    RESEARCH_LOG_ERROR("Fatal error", {research::observability::StringField("error", e.what())});
    research::observability::ShutdownLogging();
    return 2;
  }
}
