#include "interface/command_definitions.h"

namespace dropin {

const std::vector<CommandDefinition>& GetCommandDefinitions() {
  static const std::vector<CommandDefinition> kDefinitions = {
      // Core Operations
      {"/help", {}, {}, {"Show this help message"}, "Core Operations"},
      {"/exit", {}, {"/quit"}, {"Exit, deleting every scratch file"}, "Core Operations"},
      {"/stats", {}, {}, {"Show attachment totals, limits and detection state"}, "Core Operations"},

      // Attachments
      {"/attach",
       {},
       {"/add"},
       {"/attach <path>...      Attach files by path (quotes and ~ allowed)"},
       "Attachments"},
      {"/paste", {}, {}, {"Attach whatever file, file list or image is on the clipboard"}, "Attachments"},
      {"/attachments",
       {"--json", "--parts"},
       {"/list"},
       {"/attachments [--json]  List attachments, optionally as JSON",
        "/attachments --parts   Print the request parts, content included as base64"},
       "Attachments"},
      {"/remove", {}, {"/rm"}, {"/remove <id>           Remove one attachment"}, "Attachments"},
      {"/clear", {}, {}, {"Remove every attachment"}, "Attachments"},

      // Drag & Drop
      {"/drag",
       {"status", "scan"},
       {},
       {"/drag status           Show drag detection state",
        "/drag scan             Poll the watch directories now"},
       "Drag & Drop"},
  };
  return kDefinitions;
}

}  // namespace dropin
