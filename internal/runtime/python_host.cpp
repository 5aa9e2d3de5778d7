#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "python_host.hpp"

#include <iostream>
#include <memory>
#include <string>

#include "internal/runtime/host_channel.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::runtime {

namespace {

struct PyObjectDeleter {
  void operator()(PyObject* object) const {
    Py_XDECREF(object);
  }
};

using PyRef = std::unique_ptr<PyObject, PyObjectDeleter>;

// channel and script of the running call, used by logging_utils
int                g_channel        = -1;
const std::string* g_current_script = nullptr;

// ------------------------------------------------------------
// logging_utils module
// ------------------------------------------------------------

template <host::v1::ScriptLog::Level Level>
PyObject* ForwardLog(PyObject*, PyObject* args) {
  const char* message = nullptr;
  if (!PyArg_ParseTuple(args, "s", &message)) return nullptr;

  host::v1::HostFrame frame;
  auto*               log = frame.mutable_log();
  log->set_level(Level);
  log->set_script(g_current_script ? *g_current_script : "unknown");
  log->set_message(message);

  try {
    WriteFrame(g_channel, frame);
  } catch (const util::ObserverExecutionError& e) {
    PyErr_SetString(PyExc_OSError, e.what());
    return nullptr;
  }
  Py_RETURN_NONE;
}

PyMethodDef kLoggingMethods[] = {
    {"debug", ForwardLog<host::v1::ScriptLog::LEVEL_DEBUG>, METH_VARARGS, "Log at debug level."},
    {"info", ForwardLog<host::v1::ScriptLog::LEVEL_INFO>, METH_VARARGS, "Log at info level."},
    {"warning", ForwardLog<host::v1::ScriptLog::LEVEL_WARNING>, METH_VARARGS, "Log at warning level."},
    {"error", ForwardLog<host::v1::ScriptLog::LEVEL_ERROR>, METH_VARARGS, "Log at error level."},
    {nullptr, nullptr, 0, nullptr},
};

PyModuleDef kLoggingModule = {
    PyModuleDef_HEAD_INIT, "logging_utils", "Host logger for observer scripts.", -1, kLoggingMethods, nullptr, nullptr, nullptr, nullptr,
};

PyObject* InitLoggingModule() {
  return PyModule_Create(&kLoggingModule);
}

// Formats and clears the pending exception as "Type: message".
std::string FetchError() {
  PyObject* type      = nullptr;
  PyObject* value     = nullptr;
  PyObject* traceback = nullptr;
  PyErr_Fetch(&type, &value, &traceback);
  PyErr_NormalizeException(&type, &value, &traceback);
  PyRef type_ref(type), value_ref(value), traceback_ref(traceback);

  std::string message = "unknown Python error";
  if (type) {
    PyRef name(PyObject_GetAttrString(type, "__name__"));
    if (name && PyUnicode_Check(name.get())) message = PyUnicode_AsUTF8(name.get());
  }
  if (value) {
    PyRef text(PyObject_Str(value));
    if (text) {
      const char* utf8 = PyUnicode_AsUTF8(text.get());
      if (utf8 && *utf8) message += std::string(": ") + utf8;
    }
  }
  PyErr_Clear();
  return message;
}

} // namespace

PythonHost::PythonHost(int fd, std::vector<std::filesystem::path> module_paths) : fd_(fd), module_paths_(std::move(module_paths)) {
}

int PythonHost::Run() {
  if (PyImport_AppendInittab("logging_utils", &InitLoggingModule) == -1) {
    std::cerr << "notewatch-python-host: cannot register logging_utils module" << std::endl;
    return 1;
  }
  // no signal handlers, the parent decides when this process ends
  Py_InitializeEx(0);
  g_channel = fd_;

  PyObject* sys_path = PySys_GetObject("path");
  for (const auto& path : module_paths_) {
    PyRef entry(PyUnicode_FromString(path.c_str()));
    if (sys_path && entry) PyList_Insert(sys_path, 0, entry.get());
  }

  int exit_code = 0;
  try {
    host::v1::HostFrame ready;
    ready.mutable_ready()->set_version(Py_GetVersion());
    WriteFrame(fd_, ready);

    while (true) {
      host::v1::CallRequest request;
      if (ReadFrame(fd_, request) != ReadStatus::kOk) break;

      host::v1::HostFrame reply;
      *reply.mutable_result() = Execute(request);
      WriteFrame(fd_, reply);
    }
  } catch (const util::ObserverExecutionError& e) {
    std::cerr << "notewatch-python-host: " << e.what() << std::endl;
    exit_code = 1;
  }

  Py_FinalizeEx();
  return exit_code;
}

host::v1::CallResult PythonHost::Execute(const host::v1::CallRequest& request) {
  host::v1::CallResult result;
  g_current_script = &request.script_name();

  auto fail = [&](std::string error) {
    result.set_ok(false);
    result.set_error(std::move(error));
    g_current_script = nullptr;
    return result;
  };

  PyRef globals(PyDict_New());
  if (!globals) return fail(FetchError());
  PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins());
  PyRef module_name(PyUnicode_FromString(request.script_name().c_str()));
  if (module_name) PyDict_SetItemString(globals.get(), "__name__", module_name.get());

  PyRef loaded(PyRun_String(request.source().c_str(), Py_file_input, globals.get(), globals.get()));
  if (!loaded) return fail(FetchError());

  PyObject* function = PyDict_GetItemString(globals.get(), request.entry().c_str());
  if (!function || !PyCallable_Check(function)) {
    return fail("script " + request.script_name() + " does not define " + request.entry() + "()");
  }

  const auto& argument = request.argument();
  PyRef       value(PyObject_CallFunction(function, "s#", argument.data(), static_cast<Py_ssize_t>(argument.size())));
  if (!value) return fail(FetchError());

  if (PyUnicode_Check(value.get())) {
    Py_ssize_t  size = 0;
    const char* utf8 = PyUnicode_AsUTF8AndSize(value.get(), &size);
    if (!utf8) return fail(FetchError());
    result.set_value(std::string(utf8, static_cast<std::size_t>(size)));
  } else if (value.get() != Py_None) {
    return fail(request.entry() + "() must return str or None");
  }

  result.set_ok(true);
  g_current_script = nullptr;
  return result;
}

} // namespace notewatch::runtime
