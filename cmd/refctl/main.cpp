#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/reference_service.hpp"
#include "refstore/v1.hpp"

using namespace refstore::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  refctl [--config <config.yaml>] create <name> <content|-> [key=value ...]\n"
            << "  refctl [--config <config.yaml>] read <name>\n"
            << "  refctl [--config <config.yaml>] update <name> <content|->\n"
            << "  refctl [--config <config.yaml>] delete <name>\n"
            << "  refctl [--config <config.yaml>] list [prefix]\n"
            << "  refctl [--config <config.yaml>] cleanup <prefix> <max_age_seconds>\n"
            << "  refctl [--config <config.yaml>] compose [--prompt <text>] [--ref <name>] [--refs <name> ...] [--prompt-ref <name>]\n"
            << "\n"
            << "Content '-' is read from stdin. REFSTORE_DATA_DIR overrides storage.data_dir.\n";
}

static std::string ContentArg(const std::string& value) {
  if (value != "-") {
    return value;
  }
  return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

// Prints the response as JSON; exit code 2 when it carries an error.
template <typename Response>
static int Print(const Response& resp) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return 2;
  }
  std::cout << json;
  return resp.has_error() ? 2 : 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  try {
    auto config = config_path.empty() ? refstore::config::ConfigLoader::Defaults() : refstore::config::ConfigLoader::LoadFromYaml(config_path);
    config.mutable_logging()->set_to_stderr(true);
    refstore::observability::InitializeLogging(config);

    auto  app     = refstore::factory::Build(config);
    auto& service = *app.service;

    // ------------------------------------------------------------

    if (cmd == "create") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }

      CreateOrUpdateRequest req;
      req.set_name(args[1]);
      req.set_content(ContentArg(args[2]));
      for (std::size_t i = 3; i < args.size(); ++i) {
        const auto eq = args[i].find('=');
        if (eq == std::string::npos) {
          std::cerr << "metadata must be key=value: " << args[i] << "\n";
          return 1;
        }
        (*req.mutable_metadata()->mutable_entries())[args[i].substr(0, eq)] = args[i].substr(eq + 1);
      }
      return Print(service.CreateOrUpdate(req));
    }

    // ------------------------------------------------------------

    if (cmd == "read") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }

      ReadRequest req;
      req.set_name(args[1]);
      return Print(service.Read(req));
    }

    // ------------------------------------------------------------

    if (cmd == "update") {
      if (args.size() != 3) {
        Usage();
        return 1;
      }

      UpdateRequest req;
      req.set_name(args[1]);
      req.set_content(ContentArg(args[2]));
      return Print(service.Update(req));
    }

    // ------------------------------------------------------------

    if (cmd == "delete") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }

      DeleteRequest req;
      req.set_name(args[1]);
      return Print(service.Delete(req));
    }

    // ------------------------------------------------------------

    if (cmd == "list") {
      if (args.size() > 2) {
        Usage();
        return 1;
      }

      ListRequest req;
      if (args.size() == 2) {
        req.set_prefix(args[1]);
      }
      return Print(service.List(req));
    }

    // ------------------------------------------------------------

    if (cmd == "cleanup") {
      if (args.size() != 3) {
        Usage();
        return 1;
      }

      CleanupRequest req;
      req.set_prefix(args[1]);
      req.set_max_age_seconds(std::stoll(args[2]));
      return Print(service.Cleanup(req));
    }

    // ------------------------------------------------------------

    if (cmd == "compose") {
      ComposeRequest req;
      for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& flag = args[i];
        if (i + 1 >= args.size()) {
          Usage();
          return 1;
        }
        if (flag == "--prompt") {
          req.set_prompt(args[++i]);
        } else if (flag == "--ref") {
          req.set_ref(args[++i]);
        } else if (flag == "--prompt-ref") {
          req.set_prompt_ref(args[++i]);
        } else if (flag == "--refs") {
          while (i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0) {
            req.add_refs(args[++i]);
          }
        } else {
          std::cerr << "unknown compose flag: " << flag << "\n";
          return 1;
        }
      }
      return Print(service.Compose(req));
    }
  } catch (const std::exception& e) {
    std::cerr << "refctl: " << e.what() << "\n";
    refstore::observability::ShutdownLogging();
    return 2;
  }

  Usage();
  return 1;
}
