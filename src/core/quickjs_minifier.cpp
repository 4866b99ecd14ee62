#include "quickjs_minifier.hpp"
#include "utils/log.hpp"
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

QuickJsMinifier::QuickJsMinifier()
    : rt(nullptr), ctx(nullptr), initialized(false) {}

QuickJsMinifier::~QuickJsMinifier() {
  if (ctx)
    JS_FreeContext(ctx);
  if (rt)
    JS_FreeRuntime(rt);
}

bool QuickJsMinifier::initialize(const fs::path &bundle_path) {
  std::ifstream file(bundle_path);
  if (!file.is_open()) {
    log_warning("Minifier bundle not found: " + bundle_path.string());
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string bundle = buffer.str();

  if (bundle.empty()) {
    log_warning("Minifier bundle is empty: " + bundle_path.string());
    return false;
  }

  rt = JS_NewRuntime();
  if (!rt) {
    log_error("Failed to create QuickJS runtime");
    return false;
  }

  ctx = JS_NewContext(rt);
  if (!ctx) {
    log_error("Failed to create QuickJS context");
    return false;
  }

  std::string bundle_name = bundle_path.filename().string();
  JSValue result = JS_Eval(ctx, bundle.c_str(), bundle.length(),
                           bundle_name.c_str(), JS_EVAL_TYPE_GLOBAL);

  if (JS_IsException(result)) {
    JS_FreeValue(ctx, result);
    log_error("Error loading minifiers: " + takeException());
    return false;
  }
  JS_FreeValue(ctx, result);

  const char *setupCode = R"(
    globalThis.__minifyJS = function(code) {
      let result = null;
      let error = null;

      Terser.minify(code, {
        compress: {
          dead_code: true,
          drop_console: false,
          drop_debugger: true,
          keep_fargs: true
        },
        mangle: {
          toplevel: false
        },
        format: {
          comments: false
        }
      }).then(r => {
        result = r.code;
      }).catch(e => {
        error = e.message;
      });

      return { result: () => result, error: () => error };
    };

    globalThis.__minifyCSS = function(code) {
      const result = csso.minify(code, {
        restructure: false,
        comments: false
      });
      return result.css || "";
    };
  )";

  JSValue setupResult = JS_Eval(ctx, setupCode, strlen(setupCode), "<setup>",
                                JS_EVAL_TYPE_GLOBAL);

  if (JS_IsException(setupResult)) {
    JS_FreeValue(ctx, setupResult);
    log_error("Error setting up minifiers: " + takeException());
    return false;
  }
  JS_FreeValue(ctx, setupResult);

  initialized = true;
  return true;
}

std::string QuickJsMinifier::takeException() {
  JSValue exception = JS_GetException(ctx);
  const char *error = JS_ToCString(ctx, exception);
  std::string message = error ? error : "Unknown error";
  JS_FreeCString(ctx, error);
  JS_FreeValue(ctx, exception);
  return message;
}

bool QuickJsMinifier::runPendingJobs() {
  JSContext *job_ctx;
  for (int i = 0; i < 100; i++) {
    int err = JS_ExecutePendingJob(rt, &job_ctx);
    if (err < 0) {
      log_warning("Promise job execution failed");
      return false;
    }
    if (err == 0) {
      break;
    }
  }
  return true;
}

std::optional<std::string>
QuickJsMinifier::callMinifier(const char *function, const std::string &code) {
  if (!initialized) {
    return std::nullopt;
  }

  JSValue global = JS_GetGlobalObject(ctx);
  JSValue minifyFunc = JS_GetPropertyStr(ctx, global, function);

  if (!JS_IsFunction(ctx, minifyFunc)) {
    log_warning(std::string(function) + " function not found");
    JS_FreeValue(ctx, minifyFunc);
    JS_FreeValue(ctx, global);
    return std::nullopt;
  }

  JSValue codeValue = JS_NewStringLen(ctx, code.c_str(), code.length());
  JSValue args[1] = {codeValue};
  JSValue result = JS_Call(ctx, minifyFunc, global, 1, args);

  JS_FreeValue(ctx, codeValue);
  JS_FreeValue(ctx, minifyFunc);
  JS_FreeValue(ctx, global);

  if (JS_IsException(result)) {
    JS_FreeValue(ctx, result);
    log_warning(std::string(function) + " failed: " + takeException());
    return std::nullopt;
  }

  const char *str = JS_ToCString(ctx, result);
  std::string output = str ? str : "";
  JS_FreeCString(ctx, str);
  JS_FreeValue(ctx, result);

  return output;
}

std::optional<std::string>
QuickJsMinifier::minifyJS(const std::string &jsCode) {
  if (!initialized) {
    return std::nullopt;
  }

  JSValue global = JS_GetGlobalObject(ctx);
  JSValue minifyFunc = JS_GetPropertyStr(ctx, global, "__minifyJS");

  if (!JS_IsFunction(ctx, minifyFunc)) {
    log_warning("__minifyJS function not found");
    JS_FreeValue(ctx, minifyFunc);
    JS_FreeValue(ctx, global);
    return std::nullopt;
  }

  JSValue jsCodeValue = JS_NewStringLen(ctx, jsCode.c_str(), jsCode.length());
  JSValue args[1] = {jsCodeValue};
  JSValue promiseResult = JS_Call(ctx, minifyFunc, global, 1, args);

  JS_FreeValue(ctx, jsCodeValue);
  JS_FreeValue(ctx, minifyFunc);
  JS_FreeValue(ctx, global);

  if (JS_IsException(promiseResult)) {
    JS_FreeValue(ctx, promiseResult);
    log_warning("JS Error: " + takeException());
    return std::nullopt;
  }

  // Terser resolves asynchronously
  if (!runPendingJobs()) {
    JS_FreeValue(ctx, promiseResult);
    return std::nullopt;
  }

  JSValue resultFunc = JS_GetPropertyStr(ctx, promiseResult, "result");
  JSValue finalResult = JS_Call(ctx, resultFunc, promiseResult, 0, nullptr);

  JSValue errorFunc = JS_GetPropertyStr(ctx, promiseResult, "error");
  JSValue errorResult = JS_Call(ctx, errorFunc, promiseResult, 0, nullptr);

  bool hasError = !JS_IsNull(errorResult);
  if (hasError) {
    const char *errorStr = JS_ToCString(ctx, errorResult);
    log_warning(std::string("Minification error: ") +
                (errorStr ? errorStr : "Unknown"));
    JS_FreeCString(ctx, errorStr);
  }

  JS_FreeValue(ctx, errorFunc);
  JS_FreeValue(ctx, errorResult);
  JS_FreeValue(ctx, resultFunc);
  JS_FreeValue(ctx, promiseResult);

  if (hasError || JS_IsNull(finalResult)) {
    JS_FreeValue(ctx, finalResult);
    return std::nullopt;
  }

  const char *str = JS_ToCString(ctx, finalResult);
  std::string output = str ? str : "";
  JS_FreeCString(ctx, str);
  JS_FreeValue(ctx, finalResult);

  return output;
}

std::optional<std::string>
QuickJsMinifier::minifyCSS(const std::string &cssCode) {
  return callMinifier("__minifyCSS", cssCode);
}

QuickJsCompressor::QuickJsCompressor(std::shared_ptr<QuickJsMinifier> minifier,
                                     Language language)
    : minifier(std::move(minifier)), language(language) {}

std::string QuickJsCompressor::compress(const std::string &source) {
  if (!minifier) {
    return source;
  }

  auto result = (language == Language::JavaScript)
                    ? minifier->minifyJS(source)
                    : minifier->minifyCSS(source);
  return result.value_or(source);
}
