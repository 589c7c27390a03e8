#include "commands.h"

#include "devflow/domain/issue_json.h"

#include <nlohmann/json.hpp>

#include "../output.h"
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace devflow::cli {

namespace {

bool json_output(const CommandContext& ctx) { return ctx.config.format == OutputFormat::kJson; }

std::optional<std::vector<std::string>> requested_states(const CliConfig& config) {
  if (config.states.empty()) {
    return std::nullopt;
  }
  return config.states;
}

core::IssueId issue_id_of(const CliConfig& config) {
  // validate_cli_config guarantees presence for commands that call this.
  return core::IssueId{config.issue_id.value_or("")};
}

}  // namespace

int exit_code_for(const core::WorkflowError& error) {
  switch (error.kind) {
    case core::WorkflowErrorKind::kUnknownState:
    case core::WorkflowErrorKind::kIllegalTransition:
      return kExitRejected;
    case core::WorkflowErrorKind::kBackendError:
      return kExitBackend;
  }
  return kExitBackend;
}

int report_workflow_error(const CommandContext& ctx, const core::WorkflowError& error) {
  if (json_output(ctx)) {
    ctx.out << workflow_error_to_json(error).dump(2) << "\n";
  }
  ctx.err << "Error: " << error.message << "\n";
  return exit_code_for(error);
}

// ────────────────────────────────────────────────────────────────
// list
// ────────────────────────────────────────────────────────────────

int cmd_list(const CommandContext& ctx) {
  const auto listed =
      ctx.service.list_issues(ctx.config.status, ctx.config.scope, ctx.config.limit);
  if (!listed.has_value()) {
    return report_workflow_error(ctx, listed.error());
  }

  if (json_output(ctx)) {
    ctx.out << domain::issues_to_json(listed.value()).dump(2) << "\n";
  } else {
    ctx.out << render_issue_list(ctx.service.flavor(), listed.value());
  }
  return kExitOk;
}

// ────────────────────────────────────────────────────────────────
// pickup
// ────────────────────────────────────────────────────────────────

namespace {

int pickup_queue(const CommandContext& ctx) {
  const auto ranked = ctx.service.queue(requested_states(ctx.config), ctx.config.scope);
  if (!ranked.has_value()) {
    return report_workflow_error(ctx, ranked.error());
  }

  if (json_output(ctx)) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& candidate : ranked.value()) {
      j.push_back(candidate_to_json(candidate, ctx.service.priorities()));
    }
    ctx.out << j.dump(2) << "\n";
  } else {
    ctx.out << render_queue(ctx.service.flavor(), ranked.value(), ctx.service.priorities());
  }
  return kExitOk;
}

int pickup_claim(const CommandContext& ctx) {
  const core::WorkerId worker{ctx.config.worker_id.value_or("devflow")};
  const auto claimed =
      ctx.service.pickup_and_claim(requested_states(ctx.config), ctx.config.scope, worker);
  if (!claimed.has_value()) {
    return report_workflow_error(ctx, claimed.error());
  }

  if (!claimed.value().has_value()) {
    if (json_output(ctx)) {
      ctx.out << "null\n";
    } else {
      ctx.out << "No issues ready for pickup\n";
    }
    return kExitOk;
  }

  const auto& pickup = claimed.value().value();
  if (json_output(ctx)) {
    nlohmann::json j = candidate_to_json(pickup.candidate, ctx.service.priorities());
    j["claimed_by"] = worker.value;
    j["claim_registered"] = pickup.claim_registered;
    j["transition"] = receipt_to_json(pickup.receipt);
    j["skipped"] = pickup.skipped;
    ctx.out << j.dump(2) << "\n";
    return kExitOk;
  }

  ctx.out << render_pickup(ctx.service.flavor(), pickup.candidate, ctx.service.priorities());
  ctx.out << "  Claimed by: " << worker.value
          << (pickup.claim_registered ? "" : " (no claim registry)") << "\n";
  ctx.out << "  Moved: " << pickup.receipt.from_state << " -> " << pickup.receipt.to_state
          << "\n";
  for (const auto& skipped : pickup.skipped) {
    ctx.out << "  Skipped " << ctx.service.flavor().issue_ref_prefix << skipped
            << " (claimed by another worker)\n";
  }
  return kExitOk;
}

}  // namespace

int cmd_pickup(const CommandContext& ctx) {
  if (ctx.config.queue) {
    return pickup_queue(ctx);
  }
  if (ctx.config.claim) {
    return pickup_claim(ctx);
  }

  const auto picked = ctx.service.pickup(requested_states(ctx.config), ctx.config.scope);
  if (!picked.has_value()) {
    return report_workflow_error(ctx, picked.error());
  }

  if (!picked.value().has_value()) {
    if (json_output(ctx)) {
      ctx.out << "null\n";
    } else {
      ctx.out << "No issues ready for pickup\n";
    }
    return kExitOk;
  }

  if (json_output(ctx)) {
    ctx.out << candidate_to_json(picked.value().value(), ctx.service.priorities()).dump(2)
            << "\n";
  } else {
    ctx.out << render_pickup(ctx.service.flavor(), picked.value().value(),
                             ctx.service.priorities());
  }
  return kExitOk;
}

// ────────────────────────────────────────────────────────────────
// show / comment / move / complete
// ────────────────────────────────────────────────────────────────

int cmd_show(const CommandContext& ctx) {
  const auto shown = ctx.service.show(issue_id_of(ctx.config));
  if (!shown.has_value()) {
    return report_workflow_error(ctx, shown.error());
  }

  if (json_output(ctx)) {
    nlohmann::json j = domain::issue_to_json(shown.value());
    j["branch"] = workflow::branch_name_for(shown.value());
    ctx.out << j.dump(2) << "\n";
  } else {
    ctx.out << render_issue_detail(ctx.service.flavor(), shown.value());
  }
  return kExitOk;
}

int cmd_comment(const CommandContext& ctx) {
  std::string body;
  if (ctx.config.body_file.has_value()) {
    std::ifstream in(ctx.config.body_file.value());
    if (!in) {
      ctx.err << "Error: cannot read comment file '" << ctx.config.body_file.value() << "'\n";
      return kExitUsage;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    body = buffer.str();
  } else {
    body = ctx.config.body.value_or("");
  }

  if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
    ctx.err << "Error: comment body is empty\n";
    return kExitUsage;
  }

  const auto commented = ctx.service.comment(issue_id_of(ctx.config), body);
  if (!commented.has_value()) {
    return report_workflow_error(ctx, commented.error());
  }

  const std::string ref = ctx.service.flavor().issue_ref_prefix + commented.value().id.value;
  if (json_output(ctx)) {
    ctx.out << nlohmann::json{{"issue_id", commented.value().id.value}, {"posted", true}}.dump(2)
            << "\n";
  } else {
    ctx.out << "Comment posted to " << ref << "\n";
  }
  return kExitOk;
}

int cmd_move(const CommandContext& ctx) {
  const auto moved = ctx.service.move(issue_id_of(ctx.config), ctx.config.to_state.value_or(""));
  if (!moved.has_value()) {
    return report_workflow_error(ctx, moved.error());
  }

  const auto& receipt = moved.value();
  if (json_output(ctx)) {
    ctx.out << receipt_to_json(receipt).dump(2) << "\n";
  } else {
    ctx.out << "Moved " << ctx.service.flavor().issue_ref_prefix << receipt.issue_id.value
            << " from '" << receipt.from_state << "' to '" << receipt.native_state.name << "'\n";
  }
  return kExitOk;
}

int cmd_complete(const CommandContext& ctx) {
  app::CompletionRequest request;
  request.issue_id = issue_id_of(ctx.config);
  request.summary = ctx.config.summary.value_or("");
  request.confidence = ctx.config.confidence.value_or(0);
  request.test_results = ctx.config.test_results;

  const auto completed = ctx.service.complete(request);
  if (!completed.has_value()) {
    return report_workflow_error(ctx, completed.error());
  }

  const auto& result = completed.value();
  if (json_output(ctx)) {
    ctx.out << nlohmann::json{{"issue_id", result.issue.id.value},
                              {"branch", result.branch},
                              {"comment", result.comment_body},
                              {"pull_request", result.pull_request.has_value()
                                                   ? nlohmann::json(result.pull_request.value())
                                                   : nlohmann::json(nullptr)},
                              {"transition", receipt_to_json(result.receipt)}}
                   .dump(2)
            << "\n";
  } else {
    const std::string ref = ctx.service.flavor().issue_ref_prefix + result.issue.id.value;
    if (result.pull_request.has_value()) {
      ctx.out << "Pull request: " << result.pull_request.value() << "\n";
    }
    ctx.out << "Completion comment posted to " << ref << "\n";
    ctx.out << "Moved " << ref << " to '" << result.receipt.native_state.name << "'\n";
  }
  return kExitOk;
}

// ────────────────────────────────────────────────────────────────
// report / states
// ────────────────────────────────────────────────────────────────

int cmd_report(const CommandContext& ctx) {
  const auto report = ctx.service.report(ctx.config.scope);
  if (!report.has_value()) {
    return report_workflow_error(ctx, report.error());
  }

  if (json_output(ctx)) {
    ctx.out << report_to_json(report.value()).dump(2) << "\n";
  } else {
    ctx.out << render_report(ctx.service.flavor(), report.value());
  }
  return kExitOk;
}

int cmd_states(const CommandContext& ctx) {
  const auto catalog = ctx.service.workflow_catalog();
  if (!catalog.has_value()) {
    return report_workflow_error(ctx, catalog.error());
  }

  if (json_output(ctx)) {
    ctx.out << catalog_to_json(catalog.value()).dump(2) << "\n";
  } else {
    ctx.out << render_catalog(ctx.service.flavor(), catalog.value(), ctx.backend_name);
  }
  return kExitOk;
}

}  // namespace devflow::cli
