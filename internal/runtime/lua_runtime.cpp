#include "lua_runtime.hpp"

#include <lua.hpp>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <new>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::runtime {

namespace {

constexpr std::size_t kMemoryLimit   = 64 * 1024 * 1024;
constexpr std::size_t kOutputLimit   = 1024 * 1024;
constexpr int         kHookInterval  = 1000;
constexpr int         kMaxJsonDepth  = 64;

// Per-call state, reachable from C functions through the allocator userdata.
struct Sandbox {
  std::string           name;
  util::SteadyTimePoint deadline;
  bool                  timed_out = false;
  std::size_t           used      = 0;
  std::string           printed;
};

void* LimitedAlloc(void* ud, void* ptr, std::size_t osize, std::size_t nsize) {
  auto*             sandbox = static_cast<Sandbox*>(ud);
  const std::size_t old     = ptr ? osize : 0;

  if (nsize == 0) {
    std::free(ptr);
    sandbox->used -= old;
    return nullptr;
  }
  if (sandbox->used - old + nsize > kMemoryLimit) {
    return nullptr;
  }

  void* block = std::realloc(ptr, nsize);
  if (block) sandbox->used = sandbox->used - old + nsize;
  return block;
}

Sandbox* GetSandbox(lua_State* L) {
  void* ud = nullptr;
  lua_getallocf(L, &ud);
  return static_cast<Sandbox*>(ud);
}

class LuaState {
 public:
  explicit LuaState(Sandbox& sandbox) : state_(lua_newstate(LimitedAlloc, &sandbox)) {
    if (!state_) {
      throw util::ObserverExecutionError("cannot allocate Lua state");
    }
  }
  ~LuaState() {
    lua_close(state_);
  }

  LuaState(const LuaState&)            = delete;
  LuaState& operator=(const LuaState&) = delete;

  lua_State* get() const {
    return state_;
  }

 private:
  lua_State* state_;
};

void DeadlineHook(lua_State* L, lua_Debug*) {
  auto* sandbox = GetSandbox(L);
  if (util::SteadyClock::now() >= sandbox->deadline) {
    sandbox->timed_out = true;
    luaL_error(L, "timeout");
  }
}

// ------------------------------------------------------------
// print / log
// ------------------------------------------------------------

int CapturedPrint(lua_State* L) {
  auto*     sandbox = GetSandbox(L);
  const int n       = lua_gettop(L);
  for (int i = 1; i <= n; ++i) {
    std::size_t len  = 0;
    const char* text = luaL_tolstring(L, i, &len);
    if (i > 1) sandbox->printed.push_back('\t');
    sandbox->printed.append(text, len);
    lua_pop(L, 1);
  }
  sandbox->printed.push_back('\n');

  if (sandbox->printed.size() > kOutputLimit) {
    return luaL_error(L, "output limit exceeded");
  }
  return 0;
}

template <spdlog::level::level_enum Level>
int ScriptLog(lua_State* L) {
  const char* message = luaL_checkstring(L, 1);
  observability::Log(Level, "Script log", {observability::StringField("script", GetSandbox(L)->name), observability::StringField("message", message)});
  return 0;
}

// ------------------------------------------------------------
// json
//
// Lua errors unwind with longjmp, which skips C++ destructors. The
// protobuf value and rendered text live in a userdata released by __gc,
// and no other C++ object with a destructor is alive across a Lua API
// call that can raise.
// ------------------------------------------------------------

constexpr const char* kJsonScratch = "notewatch.json_scratch";

struct JsonScratch {
  google::protobuf::Value value;
  std::string             text;
};

int CollectScratch(lua_State* L) {
  static_cast<JsonScratch*>(luaL_checkudata(L, 1, kJsonScratch))->~JsonScratch();
  return 0;
}

// Pushes a new scratch userdata.
JsonScratch* NewScratch(lua_State* L) {
  void* memory = lua_newuserdatauv(L, sizeof(JsonScratch), 0);
  if (luaL_newmetatable(L, kJsonScratch)) {
    lua_pushcfunction(L, CollectScratch);
    lua_setfield(L, -2, "__gc");
  }
  // finalizer attached before the object is constructed
  lua_setmetatable(L, -2);
  return new (memory) JsonScratch();
}

void LuaToValue(lua_State* L, int index, google::protobuf::Value* out, int depth) {
  if (depth > kMaxJsonDepth) luaL_error(L, "json.encode: nesting too deep");
  index = lua_absindex(L, index);

  switch (lua_type(L, index)) {
    case LUA_TNIL:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
    case LUA_TBOOLEAN:
      out->set_bool_value(lua_toboolean(L, index) != 0);
      return;
    case LUA_TNUMBER:
      out->set_number_value(lua_tonumber(L, index));
      return;
    case LUA_TSTRING: {
      std::size_t len  = 0;
      const char* text = lua_tolstring(L, index, &len);
      out->set_string_value(text, len);
      return;
    }
    case LUA_TTABLE:
      break;
    default:
      luaL_error(L, "json.encode: cannot encode %s", luaL_typename(L, index));
      return;
  }

  luaL_checkstack(L, 4, "json.encode: nesting too deep");

  const auto  length = static_cast<lua_Integer>(lua_rawlen(L, index));
  lua_Integer keys   = 0;
  lua_pushnil(L);
  while (lua_next(L, index) != 0) {
    ++keys;
    lua_pop(L, 1);
  }

  if (length > 0 && keys == length) {
    auto* list = out->mutable_list_value();
    for (lua_Integer i = 1; i <= length; ++i) {
      lua_rawgeti(L, index, i);
      LuaToValue(L, -1, list->add_values(), depth + 1);
      lua_pop(L, 1);
    }
    return;
  }

  auto* fields = out->mutable_struct_value()->mutable_fields();
  lua_pushnil(L);
  while (lua_next(L, index) != 0) {
    const int key_type = lua_type(L, -2);
    if (key_type != LUA_TSTRING && key_type != LUA_TNUMBER) {
      luaL_error(L, "json.encode: object keys must be strings or numbers");
    }
    // tostring on a copy, lua_next needs the original key untouched
    lua_pushvalue(L, -2);
    std::size_t              len  = 0;
    const char*              key  = lua_tolstring(L, -1, &len);
    google::protobuf::Value* slot = &(*fields)[std::string(key, len)];
    lua_pop(L, 1);

    LuaToValue(L, -1, slot, depth + 1);
    lua_pop(L, 1);
  }
}

void PushValue(lua_State* L, const google::protobuf::Value& value) {
  luaL_checkstack(L, 3, "json.decode: nesting too deep");
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      lua_pushboolean(L, value.bool_value() ? 1 : 0);
      break;
    case google::protobuf::Value::kNumberValue:
      lua_pushnumber(L, value.number_value());
      break;
    case google::protobuf::Value::kStringValue:
      lua_pushlstring(L, value.string_value().data(), value.string_value().size());
      break;
    case google::protobuf::Value::kListValue: {
      const auto& items = value.list_value().values();
      lua_createtable(L, items.size(), 0);
      for (int i = 0; i < items.size(); ++i) {
        PushValue(L, items.Get(i));
        lua_rawseti(L, -2, i + 1);
      }
      break;
    }
    case google::protobuf::Value::kStructValue: {
      const auto& fields = value.struct_value().fields();
      lua_createtable(L, 0, fields.size());
      for (const auto& [key, item] : fields) {
        PushValue(L, item);
        lua_setfield(L, -2, key.c_str());
      }
      break;
    }
    default:
      lua_pushnil(L);
      break;
  }
}

// Renders scratch.value into scratch.text, or the error into it on failure.
bool RenderJson(JsonScratch& scratch) {
  scratch.text.clear();
  auto status = google::protobuf::util::MessageToJsonString(scratch.value, &scratch.text);
  if (!status.ok()) scratch.text = "json.encode: " + std::string(status.message());
  return status.ok();
}

bool ParseJson(const char* text, std::size_t len, JsonScratch& scratch) {
  auto status = google::protobuf::util::JsonStringToMessage(std::string(text, len), &scratch.value);
  if (!status.ok()) scratch.text = "json.decode: " + std::string(status.message());
  return status.ok();
}

int JsonEncode(lua_State* L) {
  luaL_checkany(L, 1);
  lua_settop(L, 1);

  auto* scratch = NewScratch(L);
  LuaToValue(L, 1, &scratch->value, 0);
  const bool ok = RenderJson(*scratch);

  lua_pushlstring(L, scratch->text.data(), scratch->text.size());
  if (!ok) return lua_error(L);
  return 1;
}

int JsonDecode(lua_State* L) {
  std::size_t len  = 0;
  const char* text = luaL_checklstring(L, 1, &len);

  auto* scratch = NewScratch(L);
  if (!ParseJson(text, len, *scratch)) {
    lua_pushlstring(L, scratch->text.data(), scratch->text.size());
    return lua_error(L);
  }
  PushValue(L, scratch->value);
  return 1;
}

// ------------------------------------------------------------
// Sandbox setup
// ------------------------------------------------------------

int OpenSandbox(lua_State* L) {
  luaL_requiref(L, LUA_GNAME, luaopen_base, 1);
  lua_pop(L, 1);

  static const char* const kRemoved[] = {"dofile", "loadfile", "load", "require", "collectgarbage", "pcall", "xpcall"};
  for (const char* name : kRemoved) {
    lua_pushnil(L);
    lua_setglobal(L, name);
  }

  lua_pushcfunction(L, CapturedPrint);
  lua_setglobal(L, "print");

  luaL_requiref(L, LUA_STRLIBNAME, luaopen_string, 1);
  luaL_requiref(L, LUA_TABLIBNAME, luaopen_table, 1);
  luaL_requiref(L, LUA_MATHLIBNAME, luaopen_math, 1);
  luaL_requiref(L, LUA_UTF8LIBNAME, luaopen_utf8, 1);
  lua_pop(L, 4);

  // os with the clock functions only
  luaL_requiref(L, LUA_OSLIBNAME, luaopen_os, 0);
  lua_newtable(L);
  for (const char* name : {"time", "date", "clock"}) {
    lua_getfield(L, -2, name);
    lua_setfield(L, -2, name);
  }
  lua_setglobal(L, LUA_OSLIBNAME);
  lua_pop(L, 1);

  static const luaL_Reg kJson[] = {{"encode", JsonEncode}, {"decode", JsonDecode}, {nullptr, nullptr}};
  luaL_newlib(L, kJson);
  lua_setglobal(L, "json");

  static const luaL_Reg kLog[] = {{"debug", ScriptLog<spdlog::level::debug>},
                                  {"info", ScriptLog<spdlog::level::info>},
                                  {"warn", ScriptLog<spdlog::level::warn>},
                                  {"error", ScriptLog<spdlog::level::err>},
                                  {nullptr, nullptr}};
  luaL_newlib(L, kLog);
  lua_setglobal(L, "log");
  return 0;
}

// Error text of a failed protected call, without converting non-strings.
std::string ErrorText(lua_State* L) {
  if (lua_type(L, -1) != LUA_TSTRING) return "unknown Lua error";
  std::size_t len  = 0;
  const char* text = lua_tolstring(L, -1, &len);
  return std::string(text, len);
}

[[noreturn]] void ThrowFailure(lua_State* L, const Sandbox& sandbox) {
  if (sandbox.timed_out) {
    throw util::ObserverExecutionError("timeout");
  }
  throw util::ObserverExecutionError(ErrorText(L));
}

void Prepare(lua_State* L, const Sandbox& sandbox) {
  lua_pushcfunction(L, OpenSandbox);
  if (lua_pcall(L, 0, 0, 0) != LUA_OK) ThrowFailure(L, sandbox);
  lua_sethook(L, DeadlineHook, LUA_MASKCOUNT, kHookInterval);
}

struct EntryCall {
  const char* script;
  const char* entry;
  const char* argument;
  std::size_t argument_len;
};

// Protected: calls the entry point and leaves nil or a string on the stack,
// tables are encoded to JSON.
int RunEntry(lua_State* L) {
  const auto* call = static_cast<const EntryCall*>(lua_touserdata(L, 1));
  if (lua_getglobal(L, call->entry) != LUA_TFUNCTION) {
    return luaL_error(L, "script %s does not define %s()", call->script, call->entry);
  }
  lua_pushlstring(L, call->argument, call->argument_len);
  lua_call(L, 1, 1);

  switch (lua_type(L, -1)) {
    case LUA_TNIL:
    case LUA_TSTRING:
      return 1;
    case LUA_TTABLE:
      lua_pushcfunction(L, JsonEncode);
      lua_insert(L, -2);
      lua_call(L, 1, 1);
      return 1;
    default:
      return luaL_error(L, "%s() must return nil, a JSON string or a table", call->entry);
  }
}

void Load(lua_State* L, const Sandbox& sandbox, const std::string& name, const std::string& source) {
  const std::string chunk_name = "=" + name;
  // text only, precompiled chunks could escape the sandbox
  if (luaL_loadbufferx(L, source.data(), source.size(), chunk_name.c_str(), "t") != LUA_OK) {
    ThrowFailure(L, sandbox);
  }
}

} // namespace

// ------------------------------------------------------------
// Pool slots
// ------------------------------------------------------------

class LuaRuntime::Slot {
 public:
  Slot(LuaRuntime& runtime, util::SteadyTimePoint deadline) : runtime_(runtime) {
    runtime_.Acquire(deadline);
  }
  ~Slot() {
    runtime_.Release();
  }

  Slot(const Slot&)            = delete;
  Slot& operator=(const Slot&) = delete;

 private:
  LuaRuntime& runtime_;
};

LuaRuntime::LuaRuntime(std::size_t pool_size) : pool_size_(pool_size == 0 ? 1 : pool_size) {
}

void LuaRuntime::Acquire(util::SteadyTimePoint deadline) {
  std::unique_lock lock(mutex_);
  if (!cv_.wait_until(lock, deadline, [&] { return in_use_ < pool_size_; })) {
    throw util::ObserverExecutionError("timeout");
  }
  ++in_use_;
}

void LuaRuntime::Release() {
  {
    std::lock_guard lock(mutex_);
    --in_use_;
  }
  cv_.notify_one();
}

// ------------------------------------------------------------
// Calls
// ------------------------------------------------------------

std::optional<std::string> LuaRuntime::CallEntry(const std::string&        script_name,
                                                 const std::string&        source,
                                                 const std::string&        entry,
                                                 const std::string&        argument,
                                                 std::chrono::milliseconds timeout) {
  const auto deadline = util::SteadyClock::now() + timeout;
  Slot       slot(*this, deadline);

  Sandbox sandbox;
  sandbox.name     = script_name;
  sandbox.deadline = deadline;

  LuaState   state(sandbox);
  lua_State* L = state.get();
  Prepare(L, sandbox);

  Load(L, sandbox, script_name, source);
  if (lua_pcall(L, 0, 0, 0) != LUA_OK) {
    ThrowFailure(L, sandbox);
  }

  const EntryCall call{script_name.c_str(), entry.c_str(), argument.data(), argument.size()};
  lua_pushcfunction(L, RunEntry);
  lua_pushlightuserdata(L, const_cast<EntryCall*>(&call));
  if (lua_pcall(L, 1, 1, 0) != LUA_OK) {
    ThrowFailure(L, sandbox);
  }

  if (!sandbox.printed.empty()) {
    NOTEWATCH_LOG_DEBUG("Script output", {observability::StringField("script", script_name), observability::StringField("output", sandbox.printed)});
  }

  if (lua_isnil(L, -1)) return std::nullopt;
  std::size_t len  = 0;
  const char* text = lua_tolstring(L, -1, &len);
  return std::string(text, len);
}

SnippetResult LuaRuntime::RunSnippet(const std::string& code, std::chrono::milliseconds timeout) {
  const auto deadline = util::SteadyClock::now() + timeout;
  Slot       slot(*this, deadline);

  Sandbox sandbox;
  sandbox.name     = "code_fence";
  sandbox.deadline = deadline;

  LuaState   state(sandbox);
  lua_State* L = state.get();
  Prepare(L, sandbox);

  SnippetResult result;
  const std::string chunk_name = "=" + sandbox.name;
  int               rc         = luaL_loadbufferx(L, code.data(), code.size(), chunk_name.c_str(), "t");
  if (rc == LUA_OK) rc = lua_pcall(L, 0, 0, 0);

  if (rc != LUA_OK) {
    if (sandbox.timed_out) {
      throw util::ObserverExecutionError("timeout");
    }
    result.ok    = false;
    result.error = ErrorText(L);
  }
  result.output = std::move(sandbox.printed);
  return result;
}

} // namespace notewatch::runtime
