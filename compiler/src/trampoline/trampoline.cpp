//! # Trampoline Generation
//!
//! IR emission for both stub directions and the engine-wide cache.

#include "trampoline/trampoline.hpp"

#include "codegen/code_generator.hpp"
#include "codegen/ir_writer.hpp"
#include "codegen/llvm_codegen.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace waot::trampoline {

using codegen::IRWriter;
using codegen::llvm_return_type;
using codegen::llvm_value_type;
using ir::ValueKind;

auto trampoline_kind_name(TrampolineKind kind) -> const char* {
    switch (kind) {
    case TrampolineKind::HostToWasm:
        return "host-to-wasm";
    case TrampolineKind::WasmToHost:
        return "wasm-to-host";
    }
    return "?";
}

auto TrampolineKey::symbol() const -> std::string {
    return kind == TrampolineKind::HostToWasm ? codegen::h2w_symbol(sig) : codegen::w2h_symbol(sig);
}

// ============================================================================
// TrampolineGenerator
// ============================================================================

TrampolineGenerator::TrampolineGenerator(target::TargetConfig target, int optimization_level)
    : target_(target), optimization_level_(optimization_level) {}

auto TrampolineGenerator::generate_ir(const TrampolineKey& key) const
    -> Result<std::string, Error> {
    if (key.sig.uses(ValueKind::V128)) {
        return Error::trampoline("no trampoline for " + key.sig.to_string() +
                                 ": v128 values are not supported");
    }
    return key.kind == TrampolineKind::HostToWasm ? host_to_wasm_ir(key.sig)
                                                  : wasm_to_host_ir(key.sig);
}

auto TrampolineGenerator::host_to_wasm_ir(const ir::FuncSig& sig) const -> std::string {
    IRWriter w;

    std::string args;
    for (size_t i = 0; i < sig.params.size(); ++i) {
        std::string slot_ptr = w.fresh_reg();
        w.emit_line("  " + slot_ptr + " = getelementptr i64, i64* %values, i64 " +
                    std::to_string(i));
        std::string raw = w.fresh_reg();
        w.emit_line("  " + raw + " = load i64, i64* " + slot_ptr + ", align 8");
        std::string value = codegen::slot_to_value(w, raw, sig.params[i]);
        args += ", " + llvm_value_type(sig.params[i]) + " " + value;
    }

    std::string fn = w.fresh_reg();
    w.emit_line("  " + fn + " = bitcast i8* %callee to " + codegen::llvm_wasm_fn_type(sig) + "*");

    std::string call = "call " + llvm_return_type(sig.results) + " " + fn + "(i8* %vmctx" + args +
                       ")";
    std::vector<std::string> results;
    if (sig.results.empty()) {
        w.emit_line("  " + call);
    } else {
        std::string r = w.fresh_reg();
        w.emit_line("  " + r + " = " + call);
        if (sig.results.size() == 1) {
            results.push_back(r);
        } else {
            std::string ret_type = llvm_return_type(sig.results);
            for (size_t i = 0; i < sig.results.size(); ++i) {
                std::string e = w.fresh_reg();
                w.emit_line("  " + e + " = extractvalue " + ret_type + " " + r + ", " +
                            std::to_string(i));
                results.push_back(e);
            }
        }
    }

    for (size_t i = 0; i < results.size(); ++i) {
        std::string raw = codegen::value_to_slot(w, results[i], sig.results[i]);
        std::string slot_ptr = w.fresh_reg();
        w.emit_line("  " + slot_ptr + " = getelementptr i64, i64* %values, i64 " +
                    std::to_string(i));
        w.emit_line("  store i64 " + raw + ", i64* " + slot_ptr + ", align 8");
    }
    w.emit_line("  ret void");

    std::string symbol = codegen::h2w_symbol(sig);
    std::string define = "define ";
    if (target_.object_format() == target::ObjectFormat::COFF) {
        define += "dllexport ";
    }
    define += "void @" + symbol + "(i8* %vmctx, i8* %callee, i64* %values) #0";
    return w.finish(symbol, define);
}

auto TrampolineGenerator::wasm_to_host_ir(const ir::FuncSig& sig) const -> std::string {
    IRWriter w;

    size_t slots = std::max<size_t>({sig.params.size(), sig.results.size(), 1});
    std::string array_type = "[" + std::to_string(slots) + " x i64]";
    std::string array = w.emit_alloca(array_type);
    std::string values = w.fresh_reg();
    w.emit_line("  " + values + " = getelementptr " + array_type + ", " + array_type + "* " +
                array + ", i64 0, i64 0");

    for (size_t i = 0; i < sig.params.size(); ++i) {
        std::string raw =
            codegen::value_to_slot(w, "%p" + std::to_string(i), sig.params[i]);
        std::string slot_ptr = w.fresh_reg();
        w.emit_line("  " + slot_ptr + " = getelementptr i64, i64* " + values + ", i64 " +
                    std::to_string(i));
        w.emit_line("  store i64 " + raw + ", i64* " + slot_ptr + ", align 8");
    }

    // VMCallee { call, env }
    std::string call_pp = w.fresh_reg();
    w.emit_line("  " + call_pp + " = bitcast i8* %callee to i8**");
    std::string call_ptr = w.fresh_reg();
    w.emit_line("  " + call_ptr + " = load i8*, i8** " + call_pp + ", align 8");
    std::string env_addr = w.fresh_reg();
    w.emit_line("  " + env_addr + " = getelementptr i8, i8* %callee, i64 8");
    std::string env_pp = w.fresh_reg();
    w.emit_line("  " + env_pp + " = bitcast i8* " + env_addr + " to i8**");
    std::string env = w.fresh_reg();
    w.emit_line("  " + env + " = load i8*, i8** " + env_pp + ", align 8");
    std::string fn = w.fresh_reg();
    w.emit_line("  " + fn + " = bitcast i8* " + call_ptr + " to void (i8*, i8*, i64*)*");
    w.emit_line("  call void " + fn + "(i8* " + env + ", i8* %vmctx, i64* " + values + ")");

    std::vector<std::string> results;
    for (size_t i = 0; i < sig.results.size(); ++i) {
        std::string slot_ptr = w.fresh_reg();
        w.emit_line("  " + slot_ptr + " = getelementptr i64, i64* " + values + ", i64 " +
                    std::to_string(i));
        std::string raw = w.fresh_reg();
        w.emit_line("  " + raw + " = load i64, i64* " + slot_ptr + ", align 8");
        results.push_back(codegen::slot_to_value(w, raw, sig.results[i]));
    }

    std::string ret_type = llvm_return_type(sig.results);
    if (results.empty()) {
        w.emit_line("  ret void");
    } else if (results.size() == 1) {
        w.emit_line("  ret " + ret_type + " " + results[0]);
    } else {
        std::string agg = "undef";
        for (size_t i = 0; i < results.size(); ++i) {
            std::string r = w.fresh_reg();
            w.emit_line("  " + r + " = insertvalue " + ret_type + " " + agg + ", " +
                        llvm_value_type(sig.results[i]) + " " + results[i] + ", " +
                        std::to_string(i));
            agg = r;
        }
        w.emit_line("  ret " + ret_type + " " + agg);
    }

    std::string symbol = codegen::w2h_symbol(sig);
    std::string define = "define " + ret_type + " @" + symbol + "(i8* %callee, i8* %vmctx";
    for (size_t i = 0; i < sig.params.size(); ++i) {
        define += ", " + llvm_value_type(sig.params[i]) + " %p" + std::to_string(i);
    }
    define += ") #0";
    return w.finish(symbol, define);
}

auto TrampolineGenerator::generate(const TrampolineKey& key) -> Result<Trampoline, Error> {
    auto ir = generate_ir(key);
    if (is_err(ir)) {
        return unwrap_err(ir);
    }

    if (!backend_.is_initialized() && !backend_.initialize()) {
        return Error::trampoline("LLVM backend unavailable: " + backend_.get_last_error());
    }

    backend::LLVMCompileOptions opts;
    opts.optimization_level = optimization_level_;
    opts.target_triple = target_.to_triple();
    opts.cpu = target_.llvm_cpu();
    opts.features = target_.llvm_features();
    opts.position_independent = true;

    auto compiled = backend_.compile_ir_to_buffer(unwrap(ir), opts);
    if (!compiled.success) {
        return Error::trampoline("failed to compile " + key.symbol() + ": " +
                                 compiled.error_message);
    }

    Trampoline out;
    out.key = key;
    out.symbol = key.symbol();
    out.object = std::move(compiled.object_data);
    out.ir = std::move(unwrap(ir));
    return out;
}

// ============================================================================
// TrampolineCache
// ============================================================================

TrampolineCache::TrampolineCache(target::TargetConfig target, int optimization_level)
    : generator_(target, optimization_level) {}

auto TrampolineCache::get_or_create(const TrampolineKey& key)
    -> Result<Rc<const Trampoline>, Error> {
    std::string symbol = key.symbol();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(symbol);
    if (it != entries_.end()) {
        return it->second;
    }

    auto generated = generator_.generate(key);
    if (is_err(generated)) {
        WAOT_LOG_WARN("trampoline", unwrap_err(generated).to_string());
        return unwrap_err(generated);
    }

    Rc<const Trampoline> tramp = make_rc<const Trampoline>(std::move(unwrap(generated)));
    entries_.emplace(symbol, tramp);
    ++generated_;
    WAOT_LOG_DEBUG("trampoline", "generated " << symbol << " ("
                                              << trampoline_kind_name(key.kind) << ", "
                                              << tramp->object.size() << " bytes)");
    return tramp;
}

auto TrampolineCache::find(const TrampolineKey& key) const -> Rc<const Trampoline> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key.symbol());
    return it == entries_.end() ? nullptr : it->second;
}

auto TrampolineCache::size() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

auto TrampolineCache::generated_count() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return generated_;
}

} // namespace waot::trampoline
