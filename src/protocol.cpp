#include "revenant/protocol.hpp"

#include <cctype>
#include <variant>

namespace revenant {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

// Non-negative integers are stored as uint64 so encode(decode(x)) is stable.
Value int_value(int64_t n) {
  if (n >= 0) return Value{static_cast<std::uint64_t>(n)};
  return Value{static_cast<std::int64_t>(n)};
}

// Name-valued options are written as Lean name literals ("`pp.all").
Value option_to_value(const OptionValue& v) {
  if (std::holds_alternative<bool>(v)) return Value{std::get<bool>(v)};
  if (std::holds_alternative<int64_t>(v)) return int_value(std::get<int64_t>(v));
  if (std::holds_alternative<std::string>(v)) return Value{std::get<std::string>(v)};
  return Value{std::string("`") + std::get<OptionName>(v).dotted};
}

std::optional<OptionValue> option_from_value(const Value& v) {
  if (std::holds_alternative<bool>(v.v)) return OptionValue{std::get<bool>(v.v)};
  if (auto n = jsonlite::as_i64(v)) return OptionValue{*n};
  if (std::holds_alternative<std::string>(v.v)) {
    const auto& s = std::get<std::string>(v.v);
    if (!s.empty() && s[0] == '`') return OptionValue{OptionName{s.substr(1)}};
    return OptionValue{s};
  }
  return std::nullopt;
}

InfoTreeMode infotree_from_string(const std::string& s) {
  if (s == "full") return InfoTreeMode::full;
  if (s == "tactics") return InfoTreeMode::tactics;
  if (s == "original") return InfoTreeMode::original;
  if (s == "substantive") return InfoTreeMode::substantive;
  return InfoTreeMode::none;
}

Position position_from(const Value* v) {
  Position p;
  if (!v) return p;
  const auto* obj = std::get_if<Object>(&v->v);
  if (!obj) return p;
  p.line = jsonlite::get_u64(*obj, "line", 0);
  p.column = jsonlite::get_u64(*obj, "column", 0);
  return p;
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::optional<Position> optional_position(const Object& obj, const std::string& key) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Object>(v->v)) return std::nullopt;
  return position_from(v);
}

bool decode_messages(const Object& obj, std::vector<Message>& out, std::string& error) {
  const Value* v = find(obj, "messages");
  if (!v || std::holds_alternative<std::nullptr_t>(v->v)) return true;
  const auto* arr = std::get_if<Array>(&v->v);
  if (!arr) { error = "messages is not an array"; return false; }
  for (const auto& item : *arr) {
    const auto* m = std::get_if<Object>(&item.v);
    if (!m) { error = "message entry is not an object"; return false; }
    Message msg;
    msg.severity = jsonlite::get_string(*m, "severity", "");
    msg.pos = position_from(find(*m, "pos"));
    msg.end_pos = optional_position(*m, "endPos");
    msg.data = jsonlite::get_string(*m, "data", "");
    out.push_back(std::move(msg));
  }
  return true;
}

bool decode_sorries(const Object& obj, std::vector<Sorry>& out, std::string& error) {
  const Value* v = find(obj, "sorries");
  if (!v || std::holds_alternative<std::nullptr_t>(v->v)) return true;
  const auto* arr = std::get_if<Array>(&v->v);
  if (!arr) { error = "sorries is not an array"; return false; }
  for (const auto& item : *arr) {
    const auto* s = std::get_if<Object>(&item.v);
    if (!s) { error = "sorry entry is not an object"; return false; }
    Sorry sorry;
    sorry.pos = position_from(find(*s, "pos"));
    sorry.end_pos = optional_position(*s, "endPos");
    sorry.goal = jsonlite::get_string(*s, "goal", "");
    sorry.proof_state = jsonlite::get_i64(*s, "proofState");
    out.push_back(std::move(sorry));
  }
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

Object request_to_object(const Request& request) {
  Object o;
  switch (request.kind) {
    case RequestKind::command:
      o["cmd"] = Value{request.text};
      break;
    case RequestKind::file_command:
      o["path"] = Value{request.text};
      break;
    case RequestKind::proof_step:
      o["tactic"] = Value{request.text};
      break;
    case RequestKind::pickle_environment:
    case RequestKind::pickle_proof_state:
      o["pickleTo"] = Value{request.text};
      break;
    case RequestKind::unpickle_environment:
      o["unpickleEnvFrom"] = Value{request.text};
      break;
    case RequestKind::unpickle_proof_state:
      o["unpickleProofStateFrom"] = Value{request.text};
      break;
  }
  if (request.env) o["env"] = int_value(*request.env);
  if (request.proof_state) o["proofState"] = int_value(*request.proof_state);

  const bool elaborates = request.kind == RequestKind::command || request.kind == RequestKind::file_command;
  if (elaborates) {
    if (request.all_tactics) o["allTactics"] = Value{true};
    if (request.root_goals) o["rootGoals"] = Value{true};
    if (request.declarations) o["declarations"] = Value{true};
    if (request.infotree != InfoTreeMode::none) o["infotree"] = Value{to_string(request.infotree)};
  }
  if (!request.options.empty()) {
    Object opts;
    for (const auto& [k, v] : request.options) opts[k.to_string()] = option_to_value(v);
    o["options"] = Value{std::move(opts)};
  }
  return o;
}

std::string encode_request(const Request& request) {
  return jsonlite::serialize(request_to_object(request));
}

std::optional<Request> decode_request(const std::string& json, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const Object o = jsonlite::parse(json, &err);
  if (err) {
    if (error) *error = err->message;
    return std::nullopt;
  }

  Request r;
  if (o.contains("cmd")) {
    r.kind = RequestKind::command;
    r.text = jsonlite::get_string(o, "cmd", "");
  } else if (o.contains("path")) {
    r.kind = RequestKind::file_command;
    r.text = jsonlite::get_string(o, "path", "");
  } else if (o.contains("tactic")) {
    r.kind = RequestKind::proof_step;
    r.text = jsonlite::get_string(o, "tactic", "");
  } else if (o.contains("pickleTo")) {
    r.kind = o.contains("proofState") ? RequestKind::pickle_proof_state : RequestKind::pickle_environment;
    r.text = jsonlite::get_string(o, "pickleTo", "");
  } else if (o.contains("unpickleEnvFrom")) {
    r.kind = RequestKind::unpickle_environment;
    r.text = jsonlite::get_string(o, "unpickleEnvFrom", "");
  } else if (o.contains("unpickleProofStateFrom")) {
    r.kind = RequestKind::unpickle_proof_state;
    r.text = jsonlite::get_string(o, "unpickleProofStateFrom", "");
  } else {
    if (error) *error = "unrecognized request shape";
    return std::nullopt;
  }

  r.env = jsonlite::get_i64(o, "env");
  r.proof_state = jsonlite::get_i64(o, "proofState");
  r.all_tactics = jsonlite::get_bool(o, "allTactics", false);
  r.root_goals = jsonlite::get_bool(o, "rootGoals", false);
  r.declarations = jsonlite::get_bool(o, "declarations", false);
  r.infotree = infotree_from_string(jsonlite::get_string(o, "infotree", ""));

  if (const Object* opts = jsonlite::get_object(o, "options")) {
    for (const auto& [k, v] : *opts) {
      auto ov = option_from_value(v);
      if (!ov) {
        if (error) *error = "unsupported option value for " + k;
        return std::nullopt;
      }
      r.options[OptionKey::parse(k)] = *ov;
    }
  }
  return r;
}

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

DecodeResult decode_response(const std::string& unit, const Request& request) {
  DecodeResult out;
  std::optional<jsonlite::JsonError> err;
  const Object o = jsonlite::parse(unit, &err);
  if (err) {
    out.error = err->code + ": " + err->message;
    return out;
  }

  Response& r = out.response;
  const bool has_env = o.contains("env");
  const bool has_ps = o.contains("proofState");

  if (!has_env && !has_ps && o.contains("message")) {
    r.kind = ResponseKind::lean_error;
    r.error_message = jsonlite::get_string(o, "message", "");
    out.ok = true;
    return out;
  }

  const bool step_kind = request.kind == RequestKind::proof_step ||
                         request.kind == RequestKind::pickle_proof_state ||
                         request.kind == RequestKind::unpickle_proof_state;
  r.kind = (has_ps && !has_env) || (step_kind && !has_env) ? ResponseKind::proof_step : ResponseKind::command;

  if (has_env) {
    r.env = jsonlite::get_i64(o, "env");
    if (!r.env) { out.error = "env is not an integer"; return out; }
  }
  if (has_ps) {
    r.proof_state = jsonlite::get_i64(o, "proofState");
    if (!r.proof_state) { out.error = "proofState is not an integer"; return out; }
  }

  std::string error;
  if (!decode_messages(o, r.messages, error) || !decode_sorries(o, r.sorries, error)) {
    out.error = error;
    return out;
  }
  r.goals = jsonlite::get_string_array(o, "goals");
  r.proof_status = jsonlite::get_string(o, "proofStatus", "");

  if (request.all_tactics) {
    if (const Array* tactics = jsonlite::get_array(o, "tactics")) {
      r.tactics_json = jsonlite::serialize(Value{*tactics});
      for (const auto& t : *tactics) {
        const auto* tobj = std::get_if<Object>(&t.v);
        if (!tobj) continue;
        if (auto ps = jsonlite::get_i64(*tobj, "proofState")) r.tactic_proof_states.push_back(*ps);
      }
    }
  }
  if (request.infotree != InfoTreeMode::none) {
    if (const Value* v = find(o, "infotree")) r.infotree_json = jsonlite::serialize(*v);
  }
  if (request.declarations) {
    if (const Value* v = find(o, "declarations")) r.declarations_json = jsonlite::serialize(*v);
  }
  if (request.root_goals) {
    if (o.contains("rootGoals")) {
      r.root_goals = jsonlite::get_string_array(o, "rootGoals");
    } else {
      std::vector<std::string> goals;
      for (const auto& s : r.sorries) goals.push_back(s.goal);
      r.root_goals = std::move(goals);
    }
  }

  out.ok = true;
  return out;
}

// ---------------------------------------------------------------------------
// FrameAssembler
// ---------------------------------------------------------------------------

namespace {
bool blank_line(std::string_view line) {
  for (char c : line) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}
}  // namespace

void FrameAssembler::feed(std::string_view bytes) {
  buf_.append(bytes.data(), bytes.size());
}

std::optional<std::string> FrameAssembler::next() {
  std::size_t pos = scan_;
  std::size_t unit_start = scan_ > 0 ? 0 : std::string::npos;
  while (true) {
    const std::size_t nl = buf_.find('\n', pos);
    if (nl == std::string::npos) break;
    const std::string_view line(buf_.data() + pos, nl - pos);
    if (blank_line(line)) {
      if (unit_start != std::string::npos) {
        std::string unit = buf_.substr(unit_start, pos - unit_start);
        buf_.erase(0, nl + 1);
        scan_ = 0;
        return unit;
      }
    } else if (unit_start == std::string::npos) {
      unit_start = pos;
    }
    pos = nl + 1;
  }
  // Drop leading blank lines so they are not rescanned.
  const std::size_t drop = unit_start == std::string::npos ? pos : unit_start;
  buf_.erase(0, drop);
  scan_ = pos - drop;
  return std::nullopt;
}

bool FrameAssembler::has_partial() const {
  return !blank_line(buf_);
}

}  // namespace revenant
