// Session catalog command line example
#include <iostream>
#include <string>
#include <vector>

#include "catalog/catalog.hpp"

using namespace catalog;

namespace {

void print_usage() {
  std::cerr << "Usage: catalog_cli [--root DIR] <command>\n"
            << "Commands:\n"
            << "  list [asc|desc]      List sessions\n"
            << "  show ID              Print one session with its messages\n"
            << "  rename ID TITLE      Set a session's description\n"
            << "  insights             Usage insights\n"
            << "  heatmap              Activity heatmap cells\n";
}

int exit_code(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidIdentifier:
      return 2;
    case ErrorKind::NotFound:
      return 3;
    case ErrorKind::CorruptData:
      return 4;
    case ErrorKind::IOFailure:
      return 5;
  }
  return 1;
}

template <typename T>
int report(const Result<T>& result) {
  std::cerr << "Error [" << to_string(result.kind()) << "]: " << result.error->message << "\n";
  return exit_code(result.kind());
}

}  // namespace

int main(int argc, char* argv[]) {
  Config config = Config::from_env();

  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.size() >= 2 && args[0] == "--root") {
    config.root = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    print_usage();
    return 1;
  }

  init(config);
  SessionStore store(config);
  const auto& command = args[0];

  if (command == "list") {
    auto order = args.size() > 1 ? sort_order_from_string(args[1]) : SortOrder::Descending;
    auto sessions = store.list_sessions(order);
    if (!sessions.ok()) return report(sessions);
    json out = json::array();
    for (const auto& info : *sessions.value) {
      out.push_back(info.to_json());
    }
    std::cout << json{{"sessions", out}}.dump(2) << "\n";
    return 0;
  }

  if (command == "show" && args.size() == 2) {
    auto record = store.get_session(args[1]);
    if (!record.ok()) return report(record);
    std::cout << record.value->to_json().dump(2) << "\n";
    return 0;
  }

  if (command == "rename" && args.size() == 3) {
    auto updated = store.update_description(args[1], args[2]);
    if (!updated.ok()) return report(updated);
    std::cout << json{{"success", true}, {"metadata", updated.value->to_json()}}.dump(2) << "\n";
    return 0;
  }

  if (command == "insights") {
    auto insights = store.insights();
    if (!insights.ok()) return report(insights);
    std::cout << insights.value->to_json().dump(2) << "\n";
    return 0;
  }

  if (command == "heatmap") {
    auto cells = store.activity_heatmap();
    if (!cells.ok()) return report(cells);
    json out = json::array();
    for (const auto& cell : *cells.value) {
      out.push_back(cell.to_json());
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  print_usage();
  return 1;
}
