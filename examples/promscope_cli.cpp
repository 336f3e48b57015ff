// promscope CLI: explore a node exporter's /metrics interactively
//
//   promscope_cli [--config FILE] [--host H] [--port N] [--path P]
//                 [--file EXPOSITION] [--log-level L] [--dump]
//
// Flags override values from --config. --file reads a saved exposition
// instead of scraping. --dump prints the snapshot re-rendered by
// prometheus-cpp and exits.

#include <promscope/promscope.hpp>

#include "backends/prometheus/PromExport.hpp"
#include "core/Config.hpp"
#include "core/Format.hpp"
#include "core/Log.hpp"
#include "fetch/TextSource.hpp"
#include "index/MetricIndex.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

struct CliArgs {
  std::string config;
  std::string file;
  std::string host;
  std::string path;
  std::string log_level;
  int  port = 0;
  bool dump = false;
  bool help = false;
};

void usage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--config FILE] [--host H] [--port N] [--path P]"
               " [--file EXPOSITION] [--log-level L] [--dump]" << std::endl;
}

bool parseArgs(int argc, char** argv, CliArgs& a, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h") { a.help = true; continue; }
    if (arg == "--dump") { a.dump = true; continue; }
    if (i + 1 >= argc) { err = "missing value for " + std::string(arg); return false; }
    std::string_view val = argv[++i];
    if (arg == "--config") a.config = val;
    else if (arg == "--file") a.file = val;
    else if (arg == "--host") a.host = val;
    else if (arg == "--path") a.path = val;
    else if (arg == "--log-level") a.log_level = val;
    else if (arg == "--port") {
      auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), a.port);
      if (ec != std::errc{} || ptr != val.data() + val.size() || a.port <= 0 || a.port > 65535) {
        err = "invalid port: " + std::string(val);
        return false;
      }
    } else {
      err = "unknown option: " + std::string(arg);
      return false;
    }
  }
  return true;
}

std::string lower(std::string_view sv) {
  std::string out(sv);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string oneLine(std::string s) {
  std::replace(s.begin(), s.end(), '\n', ' ');
  return s;
}

// Grid table in the style of python-tabulate's "grid" format
void printGrid(const std::vector<std::string>& headers,
               const std::vector<std::vector<std::string>>& rows) {
  std::vector<size_t> w(headers.size());
  for (size_t c = 0; c < headers.size(); ++c) w[c] = headers[c].size();
  for (const auto& r : rows)
    for (size_t c = 0; c < r.size() && c < w.size(); ++c) w[c] = std::max(w[c], r[c].size());

  auto rule = [&](char ch) {
    std::string line = "+";
    for (auto cw : w) line += std::string(cw + 2, ch) + "+";
    std::cout << line << '\n';
  };
  auto row = [&](const std::vector<std::string>& cells) {
    std::string line = "|";
    for (size_t c = 0; c < w.size(); ++c) {
      const std::string& cell = c < cells.size() ? cells[c] : std::string{};
      line += " " + cell + std::string(w[c] - cell.size(), ' ') + " |";
    }
    std::cout << line << '\n';
  };

  rule('-');
  row(headers);
  rule('=');
  for (const auto& r : rows) { row(r); rule('-'); }
}

std::string formatLabels(const promscope::Labels& labels) {
  std::string out = "{";
  bool first = true;
  for (const auto& [k, v] : labels) {
    if (!first) out += ", ";
    first = false;
    out += fmt::format("{}=\"{}\"", k, v);
  }
  return out + "}";
}

void showGroups(promscope::Explorer& ex) {
  std::vector<promscope::MetricGroup> groups;
  std::string err;
  if (!ex.ListGroups(groups, err)) { std::cout << "Failed to fetch metrics: " << err << std::endl; return; }
  for (const auto& g : groups) {
    std::cout << '\n' << g.prefix << ":\n";
    for (const auto& n : g.names) std::cout << "  - " << n << '\n';
  }
  std::cout.flush();
}

void showSearch(promscope::Explorer& ex, const std::string& term, size_t help_width) {
  std::vector<promscope::SearchHit> hits;
  std::string err;
  if (!ex.Search(term, hits, err)) { std::cout << "Failed to fetch metrics: " << err << std::endl; return; }
  if (hits.empty()) { std::cout << "No results found" << std::endl; return; }
  std::vector<std::vector<std::string>> rows;
  rows.reserve(hits.size());
  for (const auto& h : hits) rows.push_back({h.name, promscope::TruncateText(oneLine(h.help), help_width)});
  std::cout << "\nSearch results:\n";
  printGrid({"Metric", "Description"}, rows);
  std::cout.flush();
}

// Known names containing `input`, for a mistyped details lookup
std::vector<std::string> suggestions(const promscope::MetricIndex& idx, const std::string& input, size_t limit) {
  std::vector<std::string> out;
  const auto needle = lower(input);
  for (const auto& n : idx.Names()) {
    if (out.size() >= limit) break;
    if (lower(n).find(needle) != std::string::npos) out.push_back(n);
  }
  return out;
}

void showDetails(promscope::Explorer& ex, const std::string& name) {
  promscope::MetricDetails d;
  std::string err;
  if (!ex.Details(name, d, err)) { std::cout << "Failed to fetch metrics: " << err << std::endl; return; }

  std::cout << "\nDetails for metric: " << name << '\n' << std::string(50, '-') << '\n';
  if (d.meta) {
    std::cout << "Type: " << d.meta->type << '\n';
    std::cout << "Help: " << d.meta->help << '\n';
  }
  std::cout << "\nCurrent values:\n";
  if (d.values.empty()) {
    std::cout << "No current values found\n";
    if (auto idx = ex.Current(); idx && !name.empty()) {
      auto near = suggestions(*idx, name, 10);
      if (!near.empty()) {
        std::cout << "Did you mean:\n";
        for (const auto& n : near) std::cout << "  - " << n << '\n';
      }
    }
  }
  for (const auto& v : d.values) {
    if (v.labels.empty()) std::cout << fmt::format("Value: {}\n", v.value);
    else std::cout << fmt::format("Value: {} (Labels: {})\n", v.value, formatLabels(v.labels));
  }
  std::cout.flush();
}

bool readLine(const char* prompt, std::string& out) {
  std::cout << prompt << std::flush;
  return static_cast<bool>(std::getline(std::cin, out));
}

int interactive(promscope::Explorer& ex, const promscope::Config& cfg) {
  std::string choice;
  while (true) {
    std::cout << "\nMetrics Explorer (" << ex.Describe() << ")\n"
              << "1. List metric groups\n"
              << "2. Search metrics\n"
              << "3. Show metric details\n"
              << "4. Refresh metrics\n"
              << "5. Exit\n";
    if (!readLine("\nEnter your choice (1-5): ", choice)) break;

    if (choice == "1") {
      showGroups(ex);
    } else if (choice == "2") {
      std::string term;
      if (!readLine("Enter search term: ", term)) break;
      showSearch(ex, term, cfg.help_width);
    } else if (choice == "3") {
      std::string name;
      if (!readLine("Enter metric name: ", name)) break;
      showDetails(ex, name);
    } else if (choice == "4") {
      std::string err;
      if (ex.Refresh(err)) std::cout << "Metrics refreshed" << std::endl;
      else std::cout << "Failed to fetch metrics: " << err << std::endl;
    } else if (choice == "5") {
      break;
    } else {
      std::cout << "Invalid choice" << std::endl;
    }
  }
  return 0;
}

int dump(promscope::Explorer& ex) {
  std::string err;
  auto idx = ex.Index(err);
  if (!idx) {
    std::cerr << "Failed to fetch metrics: " << err << std::endl;
    return 1;
  }
  const auto& snap = idx->Snapshot();
  std::cout << promscope::prom::RenderText(snap);
  std::cerr << promscope::FormatStats(snap);
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  CliArgs args;
  std::string err;
  if (!parseArgs(argc, argv, args, err)) {
    std::cerr << err << std::endl;
    usage(argv[0]);
    return 2;
  }
  if (args.help) {
    usage(argv[0]);
    return 0;
  }

  promscope::Config cfg;
  if (!args.config.empty() && !promscope::ParseConfigToml(args.config, cfg, err)) {
    std::cerr << "Config error: " << err << std::endl;
    return 1;
  }
  if (!args.host.empty()) cfg.host = args.host;
  if (args.port > 0) cfg.port = args.port;
  if (!args.path.empty()) cfg.path = args.path;
  if (!args.log_level.empty()) cfg.log_level = args.log_level;
  if (!promscope::log::Init(cfg, err)) {
    std::cerr << "Logging setup failed: " << err << std::endl;
    return 1;
  }

  std::unique_ptr<promscope::TextSource> source;
  if (!args.file.empty()) source = std::make_unique<promscope::FileSource>(args.file);
  else source = std::make_unique<promscope::HttpSource>(promscope::EndpointFromConfig(cfg));
  promscope::Explorer ex(std::move(source));

  return args.dump ? dump(ex) : interactive(ex, cfg);
}
