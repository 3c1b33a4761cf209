#include "cli/CommandLine.hpp"

#include "common/Errors.hpp"
#include "core/RollbackManager.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace rwd::cli {

namespace {

constexpr size_t kDescriptionWidth = 40;

/// Pops the value that must follow sFlag, or throws UsageError.
std::string requireValue(const std::vector<std::string>& vArgs, size_t& i,
                         const std::string& sFlag) {
  if (i + 1 >= vArgs.size() || vArgs[i + 1].empty()) {
    throw common::UsageError("missing_value", sFlag + " requires a value");
  }
  return vArgs[++i];
}

std::vector<std::string> splitCommaList(const std::string& sValue) {
  std::vector<std::string> vItems;
  std::istringstream iss(sValue);
  std::string sItem;
  while (std::getline(iss, sItem, ',')) {
    const auto iStart = sItem.find_first_not_of(" \t");
    if (iStart == std::string::npos) continue;
    const auto iEnd = sItem.find_last_not_of(" \t");
    vItems.push_back(sItem.substr(iStart, iEnd - iStart + 1));
  }
  return vItems;
}

std::string joined(const std::vector<std::string>& vItems, const char* pSep = ", ") {
  std::string sOut;
  for (const auto& sItem : vItems) {
    if (!sOut.empty()) sOut += pSep;
    sOut += sItem;
  }
  return sOut;
}

std::string truncated(const std::string& sText, size_t nWidth) {
  if (sText.size() <= nWidth) return sText;
  return sText.substr(0, nWidth - 3) + "...";
}

bool isOption(const std::string& sArg) {
  return sArg.size() > 1 && sArg[0] == '-';
}

}  // namespace

// ── Parsing ────────────────────────────────────────────────────────────────

const char* CommandLine::usage() {
  return "Usage: rewind [--backup-dir DIR] [--project-root DIR] <command> [args]\n"
         "\n"
         "Commands:\n"
         "  create [-d|--description TEXT] [-s|--services a,b] [--include-volumes]\n"
         "                                 Snapshot running services, configs and optionally volumes\n"
         "  list                           List rollback points, newest first\n"
         "  show <id>                      Show a rollback point\n"
         "  rollback <id|latest> [--dry-run] [-y|--yes]\n"
         "                                 Restore the deployment to a rollback point\n"
         "  service <name> [--image REF]   Restart one service, optionally pinned to an image\n"
         "  delete <id>                    Delete a rollback point and its backups\n"
         "  help                           Show this message\n";
}

Invocation CommandLine::parse(const std::vector<std::string>& vArgs) {
  Invocation inv;
  size_t i = 0;

  // Global options precede the command
  for (; i < vArgs.size() && isOption(vArgs[i]); ++i) {
    const auto& sArg = vArgs[i];
    if (sArg == "--backup-dir") {
      inv.oBackupDir = requireValue(vArgs, i, sArg);
    } else if (sArg == "--project-root") {
      inv.oProjectRoot = requireValue(vArgs, i, sArg);
    } else if (sArg == "-h" || sArg == "--help") {
      inv.eCommand = Command::Help;
      return inv;
    } else {
      throw common::UsageError("unknown_option", "Unknown option: " + sArg);
    }
  }

  if (i >= vArgs.size()) {
    throw common::UsageError("missing_command", "No command given");
  }

  const std::string sCommand = vArgs[i++];
  std::vector<std::string> vPositional;

  if (sCommand == "help") {
    inv.eCommand = Command::Help;
    return inv;
  } else if (sCommand == "create") {
    inv.eCommand = Command::Create;
  } else if (sCommand == "list") {
    inv.eCommand = Command::List;
  } else if (sCommand == "show") {
    inv.eCommand = Command::Show;
  } else if (sCommand == "rollback") {
    inv.eCommand = Command::Rollback;
  } else if (sCommand == "service") {
    inv.eCommand = Command::Service;
  } else if (sCommand == "delete") {
    inv.eCommand = Command::Delete;
  } else {
    throw common::UsageError("unknown_command", "Unknown command: " + sCommand);
  }

  for (; i < vArgs.size(); ++i) {
    const auto& sArg = vArgs[i];
    if (!isOption(sArg)) {
      vPositional.push_back(sArg);
      continue;
    }

    if (sArg == "-h" || sArg == "--help") {
      inv.eCommand = Command::Help;
      return inv;
    }

    switch (inv.eCommand) {
      case Command::Create:
        if (sArg == "-d" || sArg == "--description") {
          inv.sDescription = requireValue(vArgs, i, sArg);
          continue;
        }
        if (sArg == "-s" || sArg == "--services") {
          inv.vServices = splitCommaList(requireValue(vArgs, i, sArg));
          if (inv.vServices.empty()) {
            throw common::UsageError("missing_value", sArg + " requires at least one service");
          }
          continue;
        }
        if (sArg == "--include-volumes") {
          inv.bIncludeVolumes = true;
          continue;
        }
        break;
      case Command::Rollback:
        if (sArg == "--dry-run") {
          inv.bDryRun = true;
          continue;
        }
        if (sArg == "-y" || sArg == "--yes") {
          inv.bAssumeYes = true;
          continue;
        }
        break;
      case Command::Service:
        if (sArg == "--image") {
          inv.oImage = requireValue(vArgs, i, sArg);
          continue;
        }
        break;
      default:
        break;
    }
    throw common::UsageError("unknown_option",
                             "Unknown option for " + sCommand + ": " + sArg);
  }

  switch (inv.eCommand) {
    case Command::Create:
      // A bare positional is accepted as the description
      if (vPositional.size() > 1 || (vPositional.size() == 1 && !inv.sDescription.empty())) {
        throw common::UsageError("unexpected_argument", "Too many arguments for create");
      }
      if (vPositional.size() == 1) {
        inv.sDescription = vPositional.front();
      }
      break;
    case Command::List:
      if (!vPositional.empty()) {
        throw common::UsageError("unexpected_argument", "list takes no arguments");
      }
      break;
    case Command::Show:
    case Command::Rollback:
    case Command::Service:
    case Command::Delete:
      if (vPositional.size() != 1) {
        throw common::UsageError("missing_argument",
                                 sCommand + " takes exactly one " +
                                     (inv.eCommand == Command::Service ? "service name"
                                                                       : "rollback id"));
      }
      inv.sTarget = vPositional.front();
      break;
    case Command::Help:
      break;
  }

  return inv;
}

// ── Rendering ──────────────────────────────────────────────────────────────

void CommandLine::printTable(std::ostream& os, const std::vector<common::RollbackPoint>& vPoints) {
  if (vPoints.empty()) {
    os << "No rollback points found\n";
    return;
  }

  os << std::left << std::setw(17) << "ID" << std::setw(29) << "TIMESTAMP" << std::setw(10)
     << "SERVICES" << std::setw(9) << "VOLUMES"
     << "DESCRIPTION\n";
  for (const auto& rp : vPoints) {
    os << std::left << std::setw(17) << rp.sId << std::setw(29) << rp.sTimestamp << std::setw(10)
       << rp.vServices.size() << std::setw(9) << rp.vVolumes.size()
       << truncated(rp.sDescription, kDescriptionWidth) << "\n";
  }
  os << "\nTotal: " << vPoints.size() << " rollback point" << (vPoints.size() == 1 ? "" : "s")
     << "\n";
}

void CommandLine::printPoint(std::ostream& os, const common::RollbackPoint& rp) {
  os << "ID:          " << rp.sId << "\n"
     << "Created:     " << rp.sTimestamp << "\n"
     << "Created by:  " << rp.sCreatedBy << "\n"
     << "Description: " << rp.sDescription << "\n"
     << "Services:\n";
  for (const auto& sService : rp.vServices) {
    auto it = rp.mImageReferences.find(sService);
    os << "  - " << sService << ": "
       << (it != rp.mImageReferences.end() ? it->second : std::string("(no image)")) << "\n";
  }
  os << "Config files (" << rp.mConfigHashes.size() << "):\n";
  for (const auto& [sRel, sHash] : rp.mConfigHashes) {
    os << "  - " << sRel << "  " << sHash.substr(0, 12) << "\n";
  }
  os << "Volumes: " << (rp.vVolumes.empty() ? std::string("(none)") : joined(rp.vVolumes))
     << "\n";
  if (!rp.mMetadata.empty()) {
    os << "Metadata:\n";
    for (const auto& [sKey, sValue] : rp.mMetadata) {
      os << "  " << sKey << ": " << sValue << "\n";
    }
  }
}

void CommandLine::printPlan(std::ostream& os, const common::RollbackPlan& pl) {
  const auto& rp = pl.rpPoint;
  os << "Rolling back to: " << rp.sId << "\n"
     << "Description:     " << rp.sDescription << "\n"
     << "Created:         " << rp.sTimestamp << "\n"
     << "Services:        " << joined(rp.vServices) << "\n"
     << "\nRollback plan:\n"
     << "  1. Stop services: " << joined(rp.vServices) << "\n"
     << "  2. Restore " << pl.vConfigFiles.size() << " configuration files";
  if (!pl.vChangedConfigFiles.empty()) {
    os << " (changed locally: " << joined(pl.vChangedConfigFiles) << ")";
  }
  os << "\n  3. Restore images:\n";
  for (const auto& svp : pl.vServices) {
    os << "     - " << svp.sService << ": "
       << (svp.sTargetImage.empty() ? std::string("(unchanged)") : svp.sTargetImage) << "\n";
  }
  if (!pl.vVolumes.empty()) {
    os << "  4. Restore " << pl.vVolumes.size() << " volumes: " << joined(pl.vVolumes) << "\n"
       << "  5. Start services\n";
  } else {
    os << "  4. Start services\n";
  }
}

void CommandLine::printServiceResult(std::ostream& os, const common::ServiceRollbackResult& srr) {
  os << "  " << (srr.bSucceeded ? "[ok]   " : "[fail] ") << std::left << std::setw(20)
     << srr.sService << common::toString(srr.eFinalState);
  if (!srr.sReason.empty()) {
    os << "  (" << srr.sReason << ")";
  }
  os << "\n";
}

void CommandLine::printReport(std::ostream& os, const common::RollbackReport& rr) {
  if (rr.bDryRun) {
    os << "\nDry run - no changes were made\n";
    return;
  }
  if (rr.bCancelled) {
    os << "Rollback cancelled\n";
    return;
  }

  os << "\nResults:\n";
  for (const auto& srr : rr.vResults) {
    printServiceResult(os, srr);
  }
  for (const auto& of : rr.vFailures) {
    os << "  [fail] " << of.sOperation << " " << of.sSubject << ": " << of.sReason << "\n";
  }
  if (rr.bSuccess) {
    os << "\nRollback to " << rr.plPlan.rpPoint.sId << " completed successfully\n";
  } else {
    os << "\nRollback to " << rr.plPlan.rpPoint.sId
       << " completed with failures; inspect the services above\n";
  }
}

// ── Dispatch ───────────────────────────────────────────────────────────────

CommandLine::CommandLine(core::RollbackManager& rmManager, std::ostream& osOut,
                         std::istream& isIn, bool bInteractive)
    : _rmManager(rmManager), _osOut(osOut), _isIn(isIn), _bInteractive(bInteractive) {}

CommandLine::~CommandLine() = default;

int CommandLine::run(const Invocation& inv) {
  switch (inv.eCommand) {
    case Command::Create:
      return runCreate(inv);
    case Command::List:
      return runList();
    case Command::Show:
      return runShow(inv);
    case Command::Rollback:
      return runRollback(inv);
    case Command::Service:
      return runService(inv);
    case Command::Delete:
      return runDelete(inv);
    case Command::Help:
      break;
  }
  _osOut << usage();
  return common::kExitSuccess;
}

int CommandLine::runCreate(const Invocation& inv) {
  std::optional<std::vector<std::string>> oServices;
  if (!inv.vServices.empty()) {
    oServices = inv.vServices;
  }
  const auto rp = _rmManager.createRollbackPoint(inv.sDescription, oServices, inv.bIncludeVolumes);
  _osOut << "Rollback point created: " << rp.sId << "\n"
         << "  Services: " << rp.vServices.size() << ", configs: " << rp.mConfigHashes.size()
         << ", volumes: " << rp.vVolumes.size() << "\n";
  return common::kExitSuccess;
}

int CommandLine::runList() {
  printTable(_osOut, _rmManager.listRollbackPoints());
  return common::kExitSuccess;
}

int CommandLine::runShow(const Invocation& inv) {
  printPoint(_osOut, _rmManager.getRollbackPoint(inv.sTarget));
  return common::kExitSuccess;
}

int CommandLine::runRollback(const Invocation& inv) {
  std::string sId = inv.sTarget;
  if (sId == "latest") {
    sId = _rmManager.latest().sId;
    _osOut << "Latest rollback point: " << sId << "\n";
  }

  const auto rr = _rmManager.rollback(
      sId, inv.bDryRun,
      [this, &inv](const common::RollbackPlan& pl) { return confirm(pl, inv.bAssumeYes); });

  if (rr.bDryRun) {
    printPlan(_osOut, rr.plPlan);
  }
  printReport(_osOut, rr);
  return rr.bSuccess ? common::kExitSuccess : common::kExitFailure;
}

int CommandLine::runService(const Invocation& inv) {
  const auto srr = _rmManager.rollbackService(inv.sTarget, inv.oImage);
  printServiceResult(_osOut, srr);
  return srr.bSucceeded ? common::kExitSuccess : common::kExitFailure;
}

int CommandLine::runDelete(const Invocation& inv) {
  if (_rmManager.deleteRollbackPoint(inv.sTarget)) {
    _osOut << "Deleted rollback point: " << inv.sTarget << "\n";
  } else {
    _osOut << "Rollback point not found, nothing deleted: " << inv.sTarget << "\n";
  }
  return common::kExitSuccess;
}

bool CommandLine::confirm(const common::RollbackPlan& pl, bool bAssumeYes) {
  printPlan(_osOut, pl);
  if (bAssumeYes) {
    return true;
  }
  if (!_bInteractive) {
    throw common::ConfirmationRequiredError(
        "confirmation_required", "Refusing to roll back without a terminal; pass --yes to proceed");
  }

  _osOut << "\nWARNING: This will roll the system back to a previous state\n"
         << "Rollback point: " << pl.rpPoint.sDescription << "\n"
         << "Created: " << pl.rpPoint.sTimestamp << "\n"
         << "\nProceed with rollback? [yes/no] " << std::flush;

  std::string sAnswer;
  if (!std::getline(_isIn, sAnswer)) {
    return false;
  }
  std::transform(sAnswer.begin(), sAnswer.end(), sAnswer.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const auto iStart = sAnswer.find_first_not_of(" \t\r");
  const auto iEnd = sAnswer.find_last_not_of(" \t\r");
  if (iStart == std::string::npos) {
    return false;
  }
  sAnswer = sAnswer.substr(iStart, iEnd - iStart + 1);
  return sAnswer == "yes" || sAnswer == "y";
}

}  // namespace rwd::cli
