#include "cli/cli.hpp"
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace farmtrace {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(pipeline::StagePipeline& pipeline, std::istream& in, std::ostream& out)
  : running_(false)
  , pipeline_(pipeline)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting shell loop";
  out_ << "farmtrace> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    if (line == "quit" || line == "exit") {
      running_ = false;
      continue;
    }

    std::istringstream iss(line);
    std::string command, argument;

    iss >> command;
    if (command.empty()) {
      // blank line
    } else if (command == "help") {
      process_command(command, "");
    } else if (iss >> argument) {
      process_command(command, argument);
    } else {
      out_ << "Invalid input. Usage: <command> <argument>" << std::endl;
    }

    if (running_) {
      out_ << "farmtrace> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Shell loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with argument: " << argument;

  if (command == "upload") {
    handle_upload_command(argument);
  } else if (command == "get") {
    handle_get_command(argument);
  } else if (command == "pin") {
    handle_pin_command(argument);
  } else if (command == "unpin") {
    handle_unpin_command(argument);
  } else if (command == "status") {
    handle_status_command(argument);
  } else if (command == "help" && argument.empty()) {
    handle_help_command();
  } else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
}

// Uploads a local JSON file and pins it
void CLI::handle_upload_command(const std::string& filename) {
  std::ifstream file(filename);
  if (!file) {
    out_ << "Error opening file: " << filename << std::endl;
    return;
  }

  try {
    record::Json document = record::Json::parse(file);
    pipeline::UploadReceipt receipt = pipeline_.upload_document(document, true);
    out_ << receipt.cid << " (" << receipt.size << " bytes, pinned)" << std::endl;
  } catch (const nlohmann::json::parse_error& e) {
    log_and_display_error("File is not valid JSON", e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Error uploading file", e.what());
  }
}

void CLI::handle_get_command(const std::string& cid) {
  try {
    out_ << pipeline_.fetch_raw(cid) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error fetching content", e.what());
  }
}

void CLI::handle_pin_command(const std::string& cid) {
  try {
    pipeline_.pin(cid);
    out_ << "Pinned " << cid << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error pinning content", e.what());
  }
}

void CLI::handle_unpin_command(const std::string& cid) {
  try {
    pipeline_.unpin(cid);
    out_ << "Unpinned " << cid << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error unpinning content", e.what());
  }
}

void CLI::handle_status_command(const std::string& cid) {
  try {
    out_ << cid << (pipeline_.is_pinned(cid) ? " is pinned" : " is not pinned") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error checking pin status", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help              Display this help message" << std::endl;
  out_ << "  upload <file>     Upload a local JSON file and pin it" << std::endl;
  out_ << "  get <cid>         Print the content stored under <cid>" << std::endl;
  out_ << "  pin <cid>         Pin <cid>" << std::endl;
  out_ << "  unpin <cid>       Unpin <cid>" << std::endl;
  out_ << "  status <cid>      Show whether <cid> is pinned" << std::endl;
  out_ << "  quit              Exit the shell" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace farmtrace
