//! # LLVM Function Code Generator
//!
//! Driver, control flow, calls, variables and memory access of the
//! function lowering. Numeric instructions live in `llvm_codegen_ops.cpp`.

#include "codegen/llvm_codegen.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>

namespace waot::codegen {

using ir::Opcode;
using ir::ValueKind;
using runtime::LibCall;
using runtime::TrapCode;
namespace vmoffsets = runtime::vmoffsets;

// ============================================================================
// Symbols
// ============================================================================

auto function_symbol(uint32_t func_index) -> std::string {
    return std::string(FUNCTION_SYMBOL_PREFIX) + std::to_string(func_index);
}

auto h2w_symbol(const ir::FuncSig& sig) -> std::string {
    return std::string(H2W_SYMBOL_PREFIX) + sig.key();
}

auto w2h_symbol(const ir::FuncSig& sig) -> std::string {
    return std::string(W2H_SYMBOL_PREFIX) + sig.key();
}

auto default_code_generator_factory() -> CodeGeneratorFactory {
    return []() -> Box<CodeGenerator> { return make_box<LLVMCodeGenerator>(); };
}

// ============================================================================
// Slot Conversions
// ============================================================================

auto slot_to_value(IRWriter& w, const std::string& slot, ValueKind kind) -> std::string {
    std::string r = w.fresh_reg();
    switch (kind) {
    case ValueKind::I64:
        return slot;
    case ValueKind::I32:
        w.emit_line("  " + r + " = trunc i64 " + slot + " to i32");
        return r;
    case ValueKind::F32: {
        std::string bits = r;
        w.emit_line("  " + bits + " = trunc i64 " + slot + " to i32");
        r = w.fresh_reg();
        w.emit_line("  " + r + " = bitcast i32 " + bits + " to float");
        return r;
    }
    case ValueKind::F64:
        w.emit_line("  " + r + " = bitcast i64 " + slot + " to double");
        return r;
    case ValueKind::Ref:
        w.emit_line("  " + r + " = inttoptr i64 " + slot + " to i8*");
        return r;
    case ValueKind::V128:
        break;
    }
    return slot;
}

auto value_to_slot(IRWriter& w, const std::string& value, ValueKind kind) -> std::string {
    std::string r = w.fresh_reg();
    switch (kind) {
    case ValueKind::I64:
        return value;
    case ValueKind::I32:
        w.emit_line("  " + r + " = zext i32 " + value + " to i64");
        return r;
    case ValueKind::F32: {
        std::string bits = r;
        w.emit_line("  " + bits + " = bitcast float " + value + " to i32");
        r = w.fresh_reg();
        w.emit_line("  " + r + " = zext i32 " + bits + " to i64");
        return r;
    }
    case ValueKind::F64:
        w.emit_line("  " + r + " = bitcast double " + value + " to i64");
        return r;
    case ValueKind::Ref:
        w.emit_line("  " + r + " = ptrtoint i8* " + value + " to i64");
        return r;
    case ValueKind::V128:
        break;
    }
    return value;
}

static auto sanitize_module_id(const std::string& name) -> std::string {
    std::string out;
    for (char c : name) {
        out += (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-')
                   ? c
                   : '_';
    }
    return out.empty() ? "module" : out;
}

static auto w2h_declaration(const ir::FuncSig& sig) -> std::string {
    std::string decl = "declare " + llvm_return_type(sig.results) + " @" + w2h_symbol(sig) +
                       "(i8*, i8*";
    for (ValueKind k : sig.params) {
        decl += ", " + llvm_value_type(k);
    }
    return decl + ") #0";
}

// ============================================================================
// FunctionLowering: Driver
// ============================================================================

FunctionLowering::FunctionLowering(const ir::ModuleIR& module, uint32_t func_index,
                                   const target::TargetConfig& target,
                                   const CodegenOptions& options)
    : module_(module), func_index_(func_index), target_(target), options_(options) {}

void FunctionLowering::fail(const std::string& message) {
    if (!error_) {
        error_ = message;
    }
}

auto FunctionLowering::function_signature() const -> std::string {
    std::string sig = "define ";
    if (target_.object_format() == target::ObjectFormat::COFF) {
        sig += "dllexport ";
    }
    sig += llvm_return_type(sig_->results) + " @" + function_symbol(func_index_) + "(i8* %vmctx";
    for (size_t i = 0; i < sig_->params.size(); ++i) {
        sig += ", " + llvm_value_type(sig_->params[i]) + " %p" + std::to_string(i);
    }
    sig += ") #0";
    return sig;
}

auto FunctionLowering::lower() -> Result<LoweredFunction, Error> {
    uint32_t n_imported = module_.num_imported_functions();
    if (func_index_ < n_imported || func_index_ >= module_.total_functions()) {
        return Error::compile_function(func_index_, "not a defined function");
    }
    func_ = &module_.functions[func_index_ - n_imported];
    sig_ = module_.function_sig(func_index_);
    if (!sig_) {
        return Error::compile_function(func_index_, "invalid type index " +
                                                        std::to_string(func_->type_index));
    }

    if (func_->body.size() > options_.max_function_instructions) {
        return Error::compile_function(
            func_index_, "size limit exceeded: " + std::to_string(func_->body.size()) +
                             " instructions (limit " +
                             std::to_string(options_.max_function_instructions) + ")");
    }

    if (sig_->uses(ValueKind::V128) ||
        std::find(func_->locals.begin(), func_->locals.end(), ValueKind::V128) !=
            func_->locals.end()) {
        return Error::compile_function(func_index_, "v128 values are not supported");
    }
    if (sig_->results.size() > 1 && !options_.features.multi_value) {
        return Error::compile_function(func_index_,
                                       "multiple results require the multi_value feature");
    }
    if ((sig_->uses(ValueKind::Ref) ||
         std::find(func_->locals.begin(), func_->locals.end(), ValueKind::Ref) !=
             func_->locals.end()) &&
        !options_.features.reference_types) {
        return Error::compile_function(func_index_,
                                       "ref values require the reference_types feature");
    }

    emit_prologue();
    push_frame(FrameKind::Function, ir::FuncSig{{}, sig_->results});

    for (instr_index_ = 0; instr_index_ < func_->body.size() && !failed(); ++instr_index_) {
        if (frames_.empty()) {
            fail("instructions after the end of the function");
            break;
        }
        lower_instr(func_->body[instr_index_]);
    }

    if (!failed()) {
        if (frames_.size() != 1) {
            fail(std::to_string(frames_.size() - 1) + " unterminated block(s)");
        } else {
            lower_end();
        }
    }

    if (error_) {
        return Error::compile_function(func_index_, *error_);
    }

    emit_trap_blocks();

    LoweredFunction out;
    out.symbol = function_symbol(func_index_);
    out.ir = w_.finish(sanitize_module_id(module_.name) + "." + out.symbol, function_signature());
    out.import_calls.assign(import_calls_.begin(), import_calls_.end());
    out.libcalls.assign(libcalls_.begin(), libcalls_.end());
    return out;
}

void FunctionLowering::emit_prologue() {
    for (size_t i = 0; i < sig_->params.size(); ++i) {
        ValueKind kind = sig_->params[i];
        std::string slot = w_.emit_alloca(llvm_value_type(kind));
        w_.emit_line("  store " + llvm_value_type(kind) + " %p" + std::to_string(i) + ", " +
                     llvm_value_type(kind) + "* " + slot);
        local_slots_.push_back(slot);
        local_kinds_.push_back(kind);
    }
    for (ValueKind kind : func_->locals) {
        std::string slot = w_.emit_alloca(llvm_value_type(kind));
        std::string zero = kind == ValueKind::Ref                               ? "null"
                           : (kind == ValueKind::F32 || kind == ValueKind::F64) ? "0.0"
                                                                                : "0";
        w_.emit_line("  store " + llvm_value_type(kind) + " " + zero + ", " +
                     llvm_value_type(kind) + "* " + slot);
        local_slots_.push_back(slot);
        local_kinds_.push_back(kind);
    }

    // Stack budget check against the limit the runtime stored in the context.
    std::string probe = w_.emit_alloca("i8");
    std::string sp = w_.fresh_reg();
    w_.emit_line("  " + sp + " = ptrtoint i8* " + probe + " to i64");
    std::string limit = load_i64_at("%vmctx", vmoffsets::STACK_LIMIT);
    std::string overflow = w_.fresh_reg();
    w_.emit_line("  " + overflow + " = icmp ult i64 " + sp + ", " + limit);
    trap_if(overflow, TrapCode::StackOverflow);
}

void FunctionLowering::emit_trap_blocks() {
    for (const auto& [code, label] : trap_labels_) {
        w_.emit_label(label);
        std::string callee = libcall_callee(LibCall::RaiseTrap);
        libcalls_.insert(static_cast<uint32_t>(LibCall::RaiseTrap));
        ir::FuncSig sig = runtime::libcall_sig(LibCall::RaiseTrap);
        w_.declare(w2h_symbol(sig), w2h_declaration(sig));
        w_.emit_line("  call void @" + w2h_symbol(sig) + "(i8* " + callee + ", i8* %vmctx, i32 " +
                     std::to_string(static_cast<uint32_t>(code)) + ")");
        w_.emit_line("  unreachable");
    }
}

auto FunctionLowering::check_features(const ir::Instr& instr) -> bool {
    const auto& features = options_.features;
    switch (instr.op) {
    case Opcode::Block:
    case Opcode::Loop:
    case Opcode::If:
        if (instr.block_sig.uses(ValueKind::V128)) {
            fail("v128 values are not supported");
            return false;
        }
        if ((instr.block_sig.results.size() > 1 || !instr.block_sig.params.empty()) &&
            !features.multi_value) {
            fail(std::string(ir::opcode_name(instr.op)) +
                 " with parameters or several results requires the multi_value feature");
            return false;
        }
        if (instr.block_sig.uses(ValueKind::Ref) && !features.reference_types) {
            fail("ref values require the reference_types feature");
            return false;
        }
        return true;
    case Opcode::RefNull:
    case Opcode::RefIsNull:
    case Opcode::RefFunc:
        if (!features.reference_types) {
            fail(std::string(ir::opcode_name(instr.op)) +
                 " requires the reference_types feature");
            return false;
        }
        return true;
    case Opcode::MemoryCopy:
    case Opcode::MemoryFill:
        if (!features.bulk_memory) {
            fail(std::string(ir::opcode_name(instr.op)) + " requires the bulk_memory feature");
            return false;
        }
        return true;
    default:
        return true;
    }
}

void FunctionLowering::lower_instr(const ir::Instr& instr) {
    if (frames_.back().unreachable) {
        switch (instr.op) {
        case Opcode::Block:
        case Opcode::Loop:
        case Opcode::If:
            ++skip_depth_;
            return;
        case Opcode::End:
            if (skip_depth_ > 0) {
                --skip_depth_;
                return;
            }
            break;
        case Opcode::Else:
            if (skip_depth_ > 0) {
                return;
            }
            break;
        default:
            return;
        }
    }

    if (!check_features(instr)) {
        return;
    }

    switch (instr.op) {
    case Opcode::Unreachable:
        w_.emit_line("  br label %" + trap_label(TrapCode::UnreachableCodeReached));
        mark_unreachable();
        return;
    case Opcode::Nop:
        return;
    case Opcode::Block:
        lower_block(instr);
        return;
    case Opcode::Loop:
        lower_loop(instr);
        return;
    case Opcode::If:
        lower_if(instr);
        return;
    case Opcode::Else:
        lower_else();
        return;
    case Opcode::End:
        if (frames_.size() == 1) {
            fail("unexpected end of the function body");
            return;
        }
        lower_end();
        return;
    case Opcode::Br:
        lower_br(instr.index);
        return;
    case Opcode::BrIf:
        lower_br_if(instr.index);
        return;
    case Opcode::BrTable:
        lower_br_table(instr);
        return;
    case Opcode::Return:
        lower_return();
        return;
    case Opcode::Call:
        lower_call(instr.index);
        return;
    case Opcode::CallIndirect:
        lower_call_indirect(instr.index);
        return;
    case Opcode::Drop:
        pop();
        return;
    case Opcode::Select:
        lower_select();
        return;
    case Opcode::LocalGet:
    case Opcode::LocalSet:
    case Opcode::LocalTee:
        lower_local(instr);
        return;
    case Opcode::GlobalGet:
    case Opcode::GlobalSet:
        lower_global(instr);
        return;
    case Opcode::RefNull:
    case Opcode::RefIsNull:
    case Opcode::RefFunc:
        lower_ref(instr);
        return;
    default:
        break;
    }

    if (lower_memory(instr) || lower_numeric(instr)) {
        return;
    }
    fail(std::string("unsupported opcode ") + ir::opcode_name(instr.op));
}

// ============================================================================
// Value Stack
// ============================================================================

void FunctionLowering::push(std::string reg, ValueKind kind) {
    stack_.push_back(StackValue{std::move(reg), kind});
}

auto FunctionLowering::pop() -> StackValue {
    size_t floor = frames_.empty() ? 0 : frames_.back().stack_height;
    if (stack_.size() <= floor) {
        fail("value stack underflow at instruction " + std::to_string(instr_index_));
        return StackValue{"0", ValueKind::I32};
    }
    StackValue v = std::move(stack_.back());
    stack_.pop_back();
    return v;
}

auto FunctionLowering::pop_n(size_t n) -> std::vector<StackValue> {
    std::vector<StackValue> values(n);
    for (size_t i = n; i > 0; --i) {
        values[i - 1] = pop();
    }
    return values;
}

auto FunctionLowering::top_n(size_t n) -> std::vector<StackValue> {
    size_t floor = frames_.empty() ? 0 : frames_.back().stack_height;
    if (stack_.size() < floor + n) {
        fail("value stack underflow at instruction " + std::to_string(instr_index_));
        return std::vector<StackValue>(n, StackValue{"0", ValueKind::I32});
    }
    return std::vector<StackValue>(stack_.end() - static_cast<std::ptrdiff_t>(n), stack_.end());
}

// ============================================================================
// Control Flow
// ============================================================================

auto FunctionLowering::alloc_slots(const std::vector<ValueKind>& kinds)
    -> std::vector<std::string> {
    std::vector<std::string> slots;
    slots.reserve(kinds.size());
    for (ValueKind kind : kinds) {
        slots.push_back(w_.emit_alloca(llvm_value_type(kind)));
    }
    return slots;
}

void FunctionLowering::store_to_slots(const std::vector<std::string>& slots,
                                      const std::vector<StackValue>& values) {
    for (size_t i = 0; i < slots.size() && i < values.size(); ++i) {
        std::string type = llvm_value_type(values[i].kind);
        w_.emit_line("  store " + type + " " + values[i].reg + ", " + type + "* " + slots[i]);
    }
}

void FunctionLowering::load_from_slots(const std::vector<std::string>& slots,
                                       const std::vector<ValueKind>& kinds) {
    for (size_t i = 0; i < slots.size(); ++i) {
        std::string type = llvm_value_type(kinds[i]);
        std::string r = w_.fresh_reg();
        w_.emit_line("  " + r + " = load " + type + ", " + type + "* " + slots[i]);
        push(r, kinds[i]);
    }
}

void FunctionLowering::push_frame(FrameKind kind, const ir::FuncSig& sig) {
    Frame frame;
    frame.kind = kind;
    frame.sig = sig;
    frame.stack_height = stack_.size() >= sig.params.size() ? stack_.size() - sig.params.size() : 0;
    switch (kind) {
    case FrameKind::Function:
        frame.end_label = "func_end";
        break;
    case FrameKind::Block:
        frame.end_label = w_.fresh_label("block_end");
        break;
    case FrameKind::Loop:
        frame.end_label = w_.fresh_label("loop_end");
        break;
    case FrameKind::If:
        frame.end_label = w_.fresh_label("if_end");
        frame.else_label = w_.fresh_label("if_else");
        break;
    }
    frame.branch_label = frame.end_label;
    frame.result_slots = alloc_slots(sig.results);
    frames_.push_back(std::move(frame));
}

auto FunctionLowering::frame_at(uint32_t depth) -> Frame* {
    if (depth >= frames_.size()) {
        fail("branch depth " + std::to_string(depth) + " out of range");
        return nullptr;
    }
    return &frames_[frames_.size() - 1 - depth];
}

auto FunctionLowering::branch_kinds(const Frame& frame) const -> const std::vector<ValueKind>& {
    return frame.kind == FrameKind::Loop ? frame.sig.params : frame.sig.results;
}

auto FunctionLowering::branch_slots(const Frame& frame) const -> const std::vector<std::string>& {
    return frame.kind == FrameKind::Loop ? frame.param_slots : frame.result_slots;
}

void FunctionLowering::mark_unreachable() {
    frames_.back().unreachable = true;
    skip_depth_ = 0;
}

void FunctionLowering::lower_block(const ir::Instr& instr) {
    if (stack_.size() < instr.block_sig.params.size()) {
        fail("value stack underflow entering block");
        return;
    }
    push_frame(FrameKind::Block, instr.block_sig);
}

void FunctionLowering::lower_loop(const ir::Instr& instr) {
    auto params = pop_n(instr.block_sig.params.size());
    if (failed()) {
        return;
    }

    // Parameters were popped, so the frame starts at the current height.
    ir::FuncSig sig = instr.block_sig;
    Frame frame;
    frame.kind = FrameKind::Loop;
    frame.sig = sig;
    frame.stack_height = stack_.size();
    frame.branch_label = w_.fresh_label("loop");
    frame.end_label = w_.fresh_label("loop_end");
    frame.param_slots = alloc_slots(sig.params);
    frame.result_slots = alloc_slots(sig.results);

    store_to_slots(frame.param_slots, params);
    w_.emit_line("  br label %" + frame.branch_label);
    w_.emit_label(frame.branch_label);
    std::vector<std::string> param_slots = frame.param_slots;
    frames_.push_back(std::move(frame));
    load_from_slots(param_slots, sig.params);
}

void FunctionLowering::lower_if(const ir::Instr& instr) {
    StackValue cond = pop();
    auto params = top_n(instr.block_sig.params.size());
    if (failed()) {
        return;
    }

    push_frame(FrameKind::If, instr.block_sig);
    Frame& frame = frames_.back();
    frame.if_params = params;

    std::string then_label = w_.fresh_label("if_then");
    std::string c = w_.fresh_reg();
    w_.emit_line("  " + c + " = icmp ne i32 " + cond.reg + ", 0");
    w_.emit_line("  br i1 " + c + ", label %" + then_label + ", label %" + frame.else_label);
    w_.emit_label(then_label);
}

void FunctionLowering::lower_else() {
    Frame& frame = frames_.back();
    if (frame.kind != FrameKind::If || frame.has_else) {
        fail("else without a matching if");
        return;
    }

    if (!frame.unreachable) {
        auto results = pop_n(frame.sig.results.size());
        store_to_slots(frame.result_slots, results);
        w_.emit_line("  br label %" + frame.end_label);
    }

    stack_.erase(stack_.begin() + static_cast<std::ptrdiff_t>(frame.stack_height), stack_.end());
    for (const auto& param : frame.if_params) {
        stack_.push_back(param);
    }
    frame.unreachable = false;
    frame.has_else = true;
    skip_depth_ = 0;
    w_.emit_label(frame.else_label);
}

void FunctionLowering::lower_end() {
    Frame& frame = frames_.back();

    if (!frame.unreachable) {
        auto results = pop_n(frame.sig.results.size());
        store_to_slots(frame.result_slots, results);
        w_.emit_line("  br label %" + frame.end_label);
    }
    if (stack_.size() < frame.stack_height) {
        fail("value stack underflow at end of block");
        return;
    }
    stack_.erase(stack_.begin() + static_cast<std::ptrdiff_t>(frame.stack_height), stack_.end());

    if (frame.kind == FrameKind::If && !frame.has_else) {
        // The missing else branch passes the parameters through.
        if (frame.sig.params != frame.sig.results) {
            fail("if without else must have matching parameters and results");
            return;
        }
        w_.emit_label(frame.else_label);
        store_to_slots(frame.result_slots, frame.if_params);
        w_.emit_line("  br label %" + frame.end_label);
    }

    Frame done = std::move(frame);
    frames_.pop_back();
    skip_depth_ = 0;

    w_.emit_label(done.end_label);
    if (done.kind == FrameKind::Function) {
        load_from_slots(done.result_slots, done.sig.results);
        emit_function_return();
        return;
    }
    load_from_slots(done.result_slots, done.sig.results);
}

void FunctionLowering::emit_function_return() {
    const auto& results = sig_->results;
    auto values = pop_n(results.size());
    if (results.empty()) {
        w_.emit_line("  ret void");
        return;
    }
    if (results.size() == 1) {
        w_.emit_line("  ret " + llvm_value_type(results[0]) + " " + values[0].reg);
        return;
    }
    std::string ret_type = llvm_return_type(results);
    std::string agg = "undef";
    for (size_t i = 0; i < values.size(); ++i) {
        std::string r = w_.fresh_reg();
        w_.emit_line("  " + r + " = insertvalue " + ret_type + " " + agg + ", " +
                     llvm_value_type(results[i]) + " " + values[i].reg + ", " + std::to_string(i));
        agg = r;
    }
    w_.emit_line("  ret " + ret_type + " " + agg);
}

void FunctionLowering::lower_br(uint32_t depth) {
    Frame* target = frame_at(depth);
    if (!target) {
        return;
    }
    auto values = top_n(branch_kinds(*target).size());
    store_to_slots(branch_slots(*target), values);
    w_.emit_line("  br label %" + target->branch_label);
    mark_unreachable();
}

void FunctionLowering::lower_br_if(uint32_t depth) {
    StackValue cond = pop();
    Frame* target = frame_at(depth);
    if (!target) {
        return;
    }
    auto values = top_n(branch_kinds(*target).size());
    store_to_slots(branch_slots(*target), values);

    std::string cont = w_.fresh_label("br_cont");
    std::string c = w_.fresh_reg();
    w_.emit_line("  " + c + " = icmp ne i32 " + cond.reg + ", 0");
    w_.emit_line("  br i1 " + c + ", label %" + target->branch_label + ", label %" + cont);
    w_.emit_label(cont);
}

void FunctionLowering::lower_br_table(const ir::Instr& instr) {
    StackValue index = pop();
    Frame* fallback = frame_at(instr.index);
    if (!fallback) {
        return;
    }
    size_t arity = branch_kinds(*fallback).size();
    auto values = top_n(arity);

    std::vector<const Frame*> stored;
    auto store_once = [&](const Frame* frame) {
        if (std::find(stored.begin(), stored.end(), frame) != stored.end()) {
            return;
        }
        stored.push_back(frame);
        store_to_slots(branch_slots(*frame), values);
    };

    std::string cases;
    for (size_t i = 0; i < instr.targets.size(); ++i) {
        Frame* target = frame_at(instr.targets[i]);
        if (!target) {
            return;
        }
        if (branch_kinds(*target).size() != arity) {
            fail("br_table targets have different arities");
            return;
        }
        store_once(target);
        cases += "    i32 " + std::to_string(i) + ", label %" + target->branch_label + "\n";
    }
    store_once(fallback);

    w_.emit_line("  switch i32 " + index.reg + ", label %" + fallback->branch_label + " [");
    w_.emit(cases);
    w_.emit_line("  ]");
    mark_unreachable();
}

void FunctionLowering::lower_return() {
    Frame& func_frame = frames_.front();
    auto values = top_n(func_frame.sig.results.size());
    store_to_slots(func_frame.result_slots, values);
    w_.emit_line("  br label %" + func_frame.end_label);
    mark_unreachable();
}

// ============================================================================
// Calls
// ============================================================================

auto FunctionLowering::call_args(const ir::FuncSig& sig) -> std::string {
    auto args = pop_n(sig.params.size());
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        out += ", " + llvm_value_type(sig.params[i]) + " " + args[i].reg;
    }
    return out;
}

void FunctionLowering::emit_call_results(const std::string& call_expr,
                                         const std::vector<ValueKind>& results) {
    if (results.empty()) {
        w_.emit_line("  " + call_expr);
        return;
    }
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = " + call_expr);
    if (results.size() == 1) {
        push(r, results[0]);
        return;
    }
    std::string ret_type = llvm_return_type(results);
    for (size_t i = 0; i < results.size(); ++i) {
        std::string e = w_.fresh_reg();
        w_.emit_line("  " + e + " = extractvalue " + ret_type + " " + r + ", " + std::to_string(i));
        push(e, results[i]);
    }
}

void FunctionLowering::lower_call(uint32_t callee) {
    const ir::FuncSig* csig = module_.function_sig(callee);
    if (!csig) {
        fail("call to unknown function " + std::to_string(callee));
        return;
    }
    std::string args = call_args(*csig);
    std::string ret = llvm_return_type(csig->results);

    if (callee < module_.num_imported_functions()) {
        import_calls_.insert(callee);
        std::string imports = load_ptr_at("%vmctx", vmoffsets::IMPORTED_FUNCTIONS);
        std::string target =
            gep(imports, std::to_string(static_cast<uint64_t>(callee) * vmoffsets::CALLEE_SIZE));
        w_.declare(w2h_symbol(*csig), w2h_declaration(*csig));
        emit_call_results("call " + ret + " @" + w2h_symbol(*csig) + "(i8* " + target +
                              ", i8* %vmctx" + args + ")",
                          csig->results);
        return;
    }

    std::string symbol = function_symbol(callee);
    if (callee != func_index_) {
        std::string decl = "declare " + ret + " @" + symbol + "(i8*";
        for (ValueKind k : csig->params) {
            decl += ", " + llvm_value_type(k);
        }
        w_.declare(symbol, decl + ") #0");
    }
    emit_call_results("call " + ret + " @" + symbol + "(i8* %vmctx" + args + ")", csig->results);
}

void FunctionLowering::lower_call_indirect(uint32_t type_index) {
    if (type_index >= module_.types.size()) {
        fail("call_indirect with unknown type " + std::to_string(type_index));
        return;
    }
    if (!module_.table_type()) {
        fail("call_indirect in a module without a table");
        return;
    }
    const ir::FuncSig& csig = module_.types[type_index];

    StackValue index = pop();
    std::string args = call_args(csig);

    std::string table = load_ptr_at("%vmctx", vmoffsets::TABLE);
    std::string size = load_i64_at(table, vmoffsets::TABLE_SIZE);
    std::string index64 = w_.fresh_reg();
    w_.emit_line("  " + index64 + " = zext i32 " + index.reg + " to i64");
    std::string oob = w_.fresh_reg();
    w_.emit_line("  " + oob + " = icmp uge i64 " + index64 + ", " + size);
    trap_if(oob, TrapCode::TableAccessOutOfBounds);

    std::string elements = load_ptr_at(table, vmoffsets::TABLE_ELEMENTS);
    std::string byte_offset = w_.fresh_reg();
    w_.emit_line("  " + byte_offset + " = mul i64 " + index64 + ", 8");
    std::string entry_addr = gep(elements, byte_offset);
    std::string entry_ptr = w_.fresh_reg();
    w_.emit_line("  " + entry_ptr + " = bitcast i8* " + entry_addr + " to i8**");
    std::string funcref = w_.fresh_reg();
    w_.emit_line("  " + funcref + " = load i8*, i8** " + entry_ptr + ", align 8");

    std::string is_null = w_.fresh_reg();
    w_.emit_line("  " + is_null + " = icmp eq i8* " + funcref + ", null");
    trap_if(is_null, TrapCode::IndirectCallToNull);

    std::string type_id = load_i64_at(funcref, vmoffsets::FUNCREF_TYPE_ID);
    std::string mismatch = w_.fresh_reg();
    w_.emit_line("  " + mismatch + " = icmp ne i64 " + type_id + ", " +
                 std::to_string(runtime::signature_id(csig)));
    trap_if(mismatch, TrapCode::BadSignature);

    std::string code = load_ptr_at(funcref, vmoffsets::FUNCREF_CODE);
    std::string callee_vmctx = load_ptr_at(funcref, vmoffsets::FUNCREF_VMCTX);
    std::string fn = w_.fresh_reg();
    w_.emit_line("  " + fn + " = bitcast i8* " + code + " to " + llvm_wasm_fn_type(csig) + "*");
    emit_call_results("call " + llvm_return_type(csig.results) + " " + fn + "(i8* " +
                          callee_vmctx + args + ")",
                      csig.results);
}

auto FunctionLowering::libcall_callee(LibCall call) -> std::string {
    std::string libcalls = load_ptr_at("%vmctx", vmoffsets::LIBCALLS);
    return gep(libcalls,
               std::to_string(static_cast<uint32_t>(call) * vmoffsets::CALLEE_SIZE));
}

void FunctionLowering::call_libcall(LibCall call, const std::vector<StackValue>& args,
                                    bool has_result) {
    libcalls_.insert(static_cast<uint32_t>(call));
    ir::FuncSig sig = runtime::libcall_sig(call);
    w_.declare(w2h_symbol(sig), w2h_declaration(sig));

    std::string callee = libcall_callee(call);
    std::string arg_list;
    for (size_t i = 0; i < args.size(); ++i) {
        arg_list += ", " + llvm_value_type(sig.params[i]) + " " + args[i].reg;
    }
    std::string expr = "call " + llvm_return_type(sig.results) + " @" + w2h_symbol(sig) +
                       "(i8* " + callee + ", i8* %vmctx" + arg_list + ")";
    if (has_result) {
        emit_call_results(expr, sig.results);
    } else {
        w_.emit_line("  " + expr);
    }
}

// ============================================================================
// Variables
// ============================================================================

void FunctionLowering::lower_local(const ir::Instr& instr) {
    if (instr.index >= local_slots_.size()) {
        fail("local index " + std::to_string(instr.index) + " out of range");
        return;
    }
    ValueKind kind = local_kinds_[instr.index];
    std::string type = llvm_value_type(kind);
    const std::string& slot = local_slots_[instr.index];

    if (instr.op == Opcode::LocalGet) {
        std::string r = w_.fresh_reg();
        w_.emit_line("  " + r + " = load " + type + ", " + type + "* " + slot);
        push(r, kind);
        return;
    }

    StackValue v = pop();
    w_.emit_line("  store " + type + " " + v.reg + ", " + type + "* " + slot);
    if (instr.op == Opcode::LocalTee) {
        push(v.reg, kind);
    }
}

auto FunctionLowering::global_cell(uint32_t global_index) -> std::string {
    std::string globals = load_ptr_at("%vmctx", vmoffsets::GLOBALS);
    std::string cell = load_ptr_at(globals, global_index * 8);
    std::string typed = w_.fresh_reg();
    w_.emit_line("  " + typed + " = bitcast i8* " + cell + " to i64*");
    return typed;
}

void FunctionLowering::lower_global(const ir::Instr& instr) {
    const ir::GlobalType* type = module_.global_type(instr.index);
    if (!type) {
        fail("global index " + std::to_string(instr.index) + " out of range");
        return;
    }

    if (instr.op == Opcode::GlobalGet) {
        std::string cell = global_cell(instr.index);
        std::string raw = w_.fresh_reg();
        w_.emit_line("  " + raw + " = load i64, i64* " + cell + ", align 8");
        push(slot_to_value(w_, raw, type->kind), type->kind);
        return;
    }

    if (!type->is_mutable) {
        fail("global.set of immutable global " + std::to_string(instr.index));
        return;
    }
    StackValue v = pop();
    std::string cell = global_cell(instr.index);
    std::string raw = value_to_slot(w_, v.reg, type->kind);
    w_.emit_line("  store i64 " + raw + ", i64* " + cell + ", align 8");
}

void FunctionLowering::lower_ref(const ir::Instr& instr) {
    switch (instr.op) {
    case Opcode::RefNull:
        push("null", ValueKind::Ref);
        return;
    case Opcode::RefIsNull: {
        StackValue v = pop();
        std::string c = w_.fresh_reg();
        w_.emit_line("  " + c + " = icmp eq i8* " + v.reg + ", null");
        std::string r = w_.fresh_reg();
        w_.emit_line("  " + r + " = zext i1 " + c + " to i32");
        push(r, ValueKind::I32);
        return;
    }
    case Opcode::RefFunc: {
        uint32_t n_imported = module_.num_imported_functions();
        if (instr.index < n_imported || instr.index >= module_.total_functions()) {
            fail("ref.func must name a defined function, got " + std::to_string(instr.index));
            return;
        }
        std::string funcrefs = load_ptr_at("%vmctx", vmoffsets::FUNCREFS);
        std::string r = gep(funcrefs, std::to_string(static_cast<uint64_t>(instr.index - n_imported) *
                                                     vmoffsets::FUNCREF_SIZE));
        push(r, ValueKind::Ref);
        return;
    }
    default:
        return;
    }
}

// ============================================================================
// Memory
// ============================================================================

namespace {

struct MemAccess {
    uint32_t size;
    const char* mem_type;
    ValueKind kind;
    char ext; ///< 's' sign-extend, 'z' zero-extend, 0 none
    bool is_store;
};

auto mem_access(Opcode op) -> std::optional<MemAccess> {
    switch (op) {
    case Opcode::I32Load:
        return MemAccess{4, "i32", ValueKind::I32, 0, false};
    case Opcode::I64Load:
        return MemAccess{8, "i64", ValueKind::I64, 0, false};
    case Opcode::F32Load:
        return MemAccess{4, "float", ValueKind::F32, 0, false};
    case Opcode::F64Load:
        return MemAccess{8, "double", ValueKind::F64, 0, false};
    case Opcode::I32Load8S:
        return MemAccess{1, "i8", ValueKind::I32, 's', false};
    case Opcode::I32Load8U:
        return MemAccess{1, "i8", ValueKind::I32, 'z', false};
    case Opcode::I32Load16S:
        return MemAccess{2, "i16", ValueKind::I32, 's', false};
    case Opcode::I32Load16U:
        return MemAccess{2, "i16", ValueKind::I32, 'z', false};
    case Opcode::I64Load8S:
        return MemAccess{1, "i8", ValueKind::I64, 's', false};
    case Opcode::I64Load8U:
        return MemAccess{1, "i8", ValueKind::I64, 'z', false};
    case Opcode::I64Load16S:
        return MemAccess{2, "i16", ValueKind::I64, 's', false};
    case Opcode::I64Load16U:
        return MemAccess{2, "i16", ValueKind::I64, 'z', false};
    case Opcode::I64Load32S:
        return MemAccess{4, "i32", ValueKind::I64, 's', false};
    case Opcode::I64Load32U:
        return MemAccess{4, "i32", ValueKind::I64, 'z', false};
    case Opcode::I32Store:
        return MemAccess{4, "i32", ValueKind::I32, 0, true};
    case Opcode::I64Store:
        return MemAccess{8, "i64", ValueKind::I64, 0, true};
    case Opcode::F32Store:
        return MemAccess{4, "float", ValueKind::F32, 0, true};
    case Opcode::F64Store:
        return MemAccess{8, "double", ValueKind::F64, 0, true};
    case Opcode::I32Store8:
        return MemAccess{1, "i8", ValueKind::I32, 0, true};
    case Opcode::I32Store16:
        return MemAccess{2, "i16", ValueKind::I32, 0, true};
    case Opcode::I64Store8:
        return MemAccess{1, "i8", ValueKind::I64, 0, true};
    case Opcode::I64Store16:
        return MemAccess{2, "i16", ValueKind::I64, 0, true};
    case Opcode::I64Store32:
        return MemAccess{4, "i32", ValueKind::I64, 0, true};
    default:
        return std::nullopt;
    }
}

} // namespace

auto FunctionLowering::heap_address(const std::string& addr, uint64_t offset, uint32_t size)
    -> std::string {
    std::string addr64 = w_.fresh_reg();
    w_.emit_line("  " + addr64 + " = zext i32 " + addr + " to i64");
    std::string effective = w_.fresh_reg();
    w_.emit_line("  " + effective + " = add i64 " + addr64 + ", " + std::to_string(offset));
    std::string end = w_.fresh_reg();
    w_.emit_line("  " + end + " = add i64 " + effective + ", " + std::to_string(size));

    std::string memory = load_ptr_at("%vmctx", vmoffsets::MEMORY);
    std::string length = load_i64_at(memory, vmoffsets::MEMORY_LENGTH);
    std::string oob = w_.fresh_reg();
    w_.emit_line("  " + oob + " = icmp ugt i64 " + end + ", " + length);
    trap_if(oob, TrapCode::HeapAccessOutOfBounds);

    std::string base = load_ptr_at(memory, vmoffsets::MEMORY_BASE);
    return gep(base, effective);
}

void FunctionLowering::lower_memory_size() {
    std::string memory = load_ptr_at("%vmctx", vmoffsets::MEMORY);
    std::string length = load_i64_at(memory, vmoffsets::MEMORY_LENGTH);
    std::string pages = w_.fresh_reg();
    w_.emit_line("  " + pages + " = udiv i64 " + length + ", " +
                 std::to_string(runtime::WASM_PAGE_SIZE));
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = trunc i64 " + pages + " to i32");
    push(r, ValueKind::I32);
}

auto FunctionLowering::lower_memory(const ir::Instr& instr) -> bool {
    bool is_memory_op = instr.op == Opcode::MemorySize || instr.op == Opcode::MemoryGrow ||
                        instr.op == Opcode::MemoryCopy || instr.op == Opcode::MemoryFill;
    auto access = mem_access(instr.op);
    if (!access && !is_memory_op) {
        return false;
    }
    if (!module_.memory_type()) {
        fail(std::string(ir::opcode_name(instr.op)) + " in a module without a memory");
        return true;
    }

    switch (instr.op) {
    case Opcode::MemorySize:
        lower_memory_size();
        return true;
    case Opcode::MemoryGrow: {
        StackValue delta = pop();
        call_libcall(LibCall::MemoryGrow, {delta}, true);
        return true;
    }
    case Opcode::MemoryCopy:
    case Opcode::MemoryFill: {
        auto args = pop_n(3);
        call_libcall(instr.op == Opcode::MemoryCopy ? LibCall::MemoryCopy : LibCall::MemoryFill,
                     args, false);
        return true;
    }
    default:
        break;
    }

    std::string value_type = llvm_value_type(access->kind);
    std::string mem_type = access->mem_type;

    if (access->is_store) {
        StackValue value = pop();
        StackValue addr = pop();
        if (failed()) {
            return true;
        }
        std::string stored = value.reg;
        if (mem_type != value_type) {
            stored = w_.fresh_reg();
            w_.emit_line("  " + stored + " = trunc " + value_type + " " + value.reg + " to " +
                         mem_type);
        }
        std::string ptr = heap_address(addr.reg, instr.imm, access->size);
        std::string typed = w_.fresh_reg();
        w_.emit_line("  " + typed + " = bitcast i8* " + ptr + " to " + mem_type + "*");
        w_.emit_line("  store " + mem_type + " " + stored + ", " + mem_type + "* " + typed +
                     ", align 1");
        return true;
    }

    StackValue addr = pop();
    if (failed()) {
        return true;
    }
    std::string ptr = heap_address(addr.reg, instr.imm, access->size);
    std::string typed = w_.fresh_reg();
    w_.emit_line("  " + typed + " = bitcast i8* " + ptr + " to " + mem_type + "*");
    std::string loaded = w_.fresh_reg();
    w_.emit_line("  " + loaded + " = load " + mem_type + ", " + mem_type + "* " + typed +
                 ", align 1");
    if (access->ext != 0) {
        std::string extended = w_.fresh_reg();
        w_.emit_line("  " + extended + " = " + (access->ext == 's' ? "sext " : "zext ") +
                     mem_type + " " + loaded + " to " + value_type);
        loaded = extended;
    }
    push(loaded, access->kind);
    return true;
}

// ============================================================================
// VMContext Access and Traps
// ============================================================================

auto FunctionLowering::gep(const std::string& base, const std::string& offset) -> std::string {
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = getelementptr i8, i8* " + base + ", i64 " + offset);
    return r;
}

auto FunctionLowering::load_ptr_at(const std::string& base, uint32_t offset) -> std::string {
    std::string addr = gep(base, std::to_string(offset));
    std::string typed = w_.fresh_reg();
    w_.emit_line("  " + typed + " = bitcast i8* " + addr + " to i8**");
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = load i8*, i8** " + typed + ", align 8");
    return r;
}

auto FunctionLowering::load_i64_at(const std::string& base, uint32_t offset) -> std::string {
    std::string addr = gep(base, std::to_string(offset));
    std::string typed = w_.fresh_reg();
    w_.emit_line("  " + typed + " = bitcast i8* " + addr + " to i64*");
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = load i64, i64* " + typed + ", align 8");
    return r;
}

auto FunctionLowering::trap_label(TrapCode code) -> std::string {
    auto it = trap_labels_.find(code);
    if (it != trap_labels_.end()) {
        return it->second;
    }
    std::string label = std::string("trap_") + runtime::trap_code_identifier(code);
    trap_labels_.emplace(code, label);
    return label;
}

void FunctionLowering::trap_if(const std::string& cond, TrapCode code) {
    std::string ok = w_.fresh_label("ok");
    w_.emit_line("  br i1 " + cond + ", label %" + trap_label(code) + ", label %" + ok);
    w_.emit_label(ok);
}

// ============================================================================
// LLVMCodeGenerator
// ============================================================================

LLVMCodeGenerator::LLVMCodeGenerator() = default;

auto LLVMCodeGenerator::compile_function(const ir::ModuleIR& module, uint32_t func_index,
                                         const target::TargetConfig& target,
                                         const CodegenOptions& options)
    -> Result<CodegenOutput, Error> {
    if (!backend_.is_initialized() && !backend_.initialize()) {
        return Error::compile_function(func_index,
                                       "LLVM backend unavailable: " + backend_.get_last_error());
    }

    FunctionLowering lowering(module, func_index, target, options);
    auto lowered = lowering.lower();
    if (is_err(lowered)) {
        return unwrap_err(lowered);
    }
    LoweredFunction& fn = unwrap(lowered);

    backend::LLVMCompileOptions compile_opts;
    compile_opts.optimization_level = options.optimization_level;
    compile_opts.target_triple = target.to_triple();
    compile_opts.cpu = target.llvm_cpu();
    compile_opts.features = target.llvm_features();
    compile_opts.position_independent = true;

    auto result = backend_.compile_ir_to_buffer(fn.ir, compile_opts);
    if (!result.success) {
        WAOT_LOG_DEBUG("codegen", "function " << func_index << " IR:\n" << fn.ir);
        return Error::compile_function(func_index, result.error_message);
    }

    WAOT_LOG_TRACE("codegen", "function " << func_index << ": " << fn.ir.size() << " bytes of IR, "
                                          << result.object_data.size() << " bytes of object");

    CodegenOutput out;
    out.object = std::move(result.object_data);
    out.symbol = std::move(fn.symbol);
    out.import_calls = std::move(fn.import_calls);
    out.libcalls = std::move(fn.libcalls);
    out.ir = std::move(fn.ir);
    return out;
}

} // namespace waot::codegen
