#pragma once

#include <istream>
#include <ostream>
#include <string>
#include "pipeline/stage_pipeline.hpp"

namespace farmtrace {
namespace cli {

// Operator shell over the storage passthrough: upload, fetch and pin
// management without going through HTTP.
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(pipeline::StagePipeline& pipeline, std::istream& in, std::ostream& out);


    // ---- STARTUP ----
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    pipeline::StagePipeline& pipeline_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& argument);
    void handle_upload_command(const std::string& filename);
    void handle_get_command(const std::string& cid);
    void handle_pin_command(const std::string& cid);
    void handle_unpin_command(const std::string& cid);
    void handle_status_command(const std::string& cid);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace farmtrace
