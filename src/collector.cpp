#include "kiln/collector.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <optional>
#include <string_view>

namespace kiln {

namespace {

struct Specifier {
    std::string name;
    std::optional<std::string> alias;
    bool is_type_only = false;
    size_t local_token = 0;
};

bool is_name(const Token &tok) {
    return tok.kind == TokenKind::Identifier || tok.kind == TokenKind::String;
}

// `{ a, b as c, type d }` at `open`.
std::vector<Specifier> read_specifiers(const TokenStream &ts, size_t open) {
    std::vector<Specifier> out;
    size_t close = ts.partner(open);
    size_t k = open + 1;
    while (k < close) {
        Specifier spec;
        if (ts.at(k).is_word("type") && is_name(ts.at(k + 1)) &&
            !(ts.at(k + 1).is_word("as") && (ts.at(k + 2).is(",") || ts.at(k + 2).is("}")))) {
            spec.is_type_only = true;
            ++k;
        }
        if (!is_name(ts.at(k))) {
            ++k;
            continue;
        }
        spec.name = std::string(key_text(ts.at(k)));
        spec.local_token = k;
        ++k;
        if (ts.at(k).is_word("as") && is_name(ts.at(k + 1))) {
            spec.alias = std::string(key_text(ts.at(k + 1)));
            spec.local_token = k + 1;
            k += 2;
        }
        out.push_back(std::move(spec));
        if (ts.at(k).is(","))
            ++k;
    }
    return out;
}

template <typename OnName>
size_t read_declarators(const TokenStream &ts, size_t k, OnName &&on_name) {
    while (true) {
        const Token &tok = ts.at(k);
        if (tok.is_identifier()) {
            on_name(tok.text);
            ++k;
        } else if (tok.is("{") || tok.is("[")) {
            k = group_end(ts, k);
        } else {
            return k;
        }
        if (ts.at(k).is("!"))
            ++k;
        if (ts.at(k).is(":"))
            k = skip_type(ts, k + 1);
        if (ts.at(k).is("="))
            k = expression_end(ts, k + 1);
        if (!ts.at(k).is(","))
            return k;
        ++k;
    }
}

size_t read_import(const TokenStream &ts, size_t i, ModuleDeclarations &decls) {
    size_t k = i + 1;
    bool clause_type_only = false;
    if (ts.at(k).is_word("type") && !ts.at(k + 1).is_word("from") && !ts.at(k + 1).is(",") && !ts.at(k + 1).is("=")) {
        clause_type_only = true;
        ++k;
    }

    std::vector<ModuleImport> found;
    std::vector<size_t> tokens;
    if (ts.at(k).is_identifier() && !ts.at(k).is_word("from")) {
        if (ts.at(k + 1).is("="))
            return k + 2; // import x = require("...")
        found.push_back({.source = {}, .imported = "default", .local = std::string(ts.at(k).text),
                         .kind = ImportKind::Default, .is_type_only = clause_type_only});
        tokens.push_back(k);
        ++k;
        if (ts.at(k).is(","))
            ++k;
    } else if (ts.at(k).is_identifier() && ts.at(k).is_word("from") && ts.at(k + 1).is_word("from")) {
        found.push_back({.source = {}, .imported = "default", .local = "from", .kind = ImportKind::Default,
                         .is_type_only = clause_type_only});
        tokens.push_back(k);
        ++k;
    }

    if (ts.at(k).is("*") && ts.at(k + 1).is_word("as") && ts.at(k + 2).is_identifier()) {
        found.push_back({.source = {}, .imported = "*", .local = std::string(ts.at(k + 2).text),
                         .kind = ImportKind::Namespace, .is_type_only = clause_type_only});
        tokens.push_back(k + 2);
        k += 3;
    } else if (ts.at(k).is("{")) {
        for (Specifier &spec : read_specifiers(ts, k)) {
            ImportKind kind = spec.name == "default" ? ImportKind::Default : ImportKind::Named;
            std::string local = spec.alias ? *spec.alias : spec.name;
            found.push_back({.source = {}, .imported = std::move(spec.name), .local = std::move(local), .kind = kind,
                             .is_type_only = clause_type_only || spec.is_type_only});
            tokens.push_back(spec.local_token);
        }
        k = group_end(ts, k);
    }

    if (ts.at(k).is_word("from"))
        ++k;
    if (ts.at(k).kind != TokenKind::String)
        return k;
    std::string source(key_text(ts.at(k)));
    for (size_t n = 0; n < found.size(); ++n) {
        found[n].source = source;
        decls.imports.push_back(std::move(found[n]));
        decls.import_tokens.push_back(tokens[n]);
    }
    return k + 1;
}

size_t read_export(const TokenStream &ts, size_t i, ModuleDeclarations &decls) {
    size_t k = i + 1;
    const Token &tok = ts.at(k);

    auto add_named = [&](std::string_view name) {
        decls.exports.push_back({.kind = ExportKind::Named, .exported = std::string(name), .local = std::string(name),
                                 .source = std::nullopt, .is_type_only = false});
        decls.root_bindings.emplace_back(name);
    };

    if (tok.is_word("default")) {
        ++k;
        if (ts.at(k).is_word("async"))
            ++k;
        std::optional<std::string> local;
        if ((ts.at(k).is_word("function") || ts.at(k).is_word("class"))) {
            size_t name = ts.at(k + 1).is("*") ? k + 2 : k + 1;
            if (ts.at(name).is_identifier() && !ts.at(name).is_word("extends") && !ts.at(name).is_word("implements")) {
                local = std::string(ts.at(name).text);
                decls.root_bindings.push_back(*local);
            }
        } else if (ts.at(k).is_identifier() &&
                   (ts.at(k + 1).is(";") || ts.at(k + 1).kind == TokenKind::End || ts.at(k + 1).newline_before)) {
            local = std::string(ts.at(k).text);
        }
        decls.exports.push_back(
            {.kind = ExportKind::Named, .exported = "default", .local = local, .source = std::nullopt, .is_type_only = false});
        return k;
    }

    bool type_only = false;
    if (tok.is_word("type")) {
        if (!ts.at(k + 1).is("{") && !ts.at(k + 1).is("*"))
            return k; // type alias
        type_only = true;
        ++k;
    }

    if (ts.at(k).is("*")) {
        ModuleExport exp{.kind = ExportKind::Reexport, .exported = "*", .local = std::nullopt, .source = std::nullopt,
                         .is_type_only = type_only};
        ++k;
        if (ts.at(k).is_word("as") && is_name(ts.at(k + 1))) {
            exp.exported = std::string(key_text(ts.at(k + 1)));
            exp.local = "*";
            k += 2;
        }
        if (ts.at(k).is_word("from") && ts.at(k + 1).kind == TokenKind::String) {
            exp.source = std::string(key_text(ts.at(k + 1)));
            decls.exports.push_back(std::move(exp));
            k += 2;
        }
        return k;
    }

    if (ts.at(k).is("{")) {
        std::vector<Specifier> specs = read_specifiers(ts, k);
        k = group_end(ts, k);
        std::optional<std::string> source;
        if (ts.at(k).is_word("from") && ts.at(k + 1).kind == TokenKind::String) {
            source = std::string(key_text(ts.at(k + 1)));
            k += 2;
        }
        for (Specifier &spec : specs) {
            ModuleExport exp;
            exp.kind = source ? ExportKind::Reexport : ExportKind::Named;
            exp.exported = spec.alias ? *spec.alias : spec.name;
            exp.local = std::move(spec.name);
            exp.source = source;
            exp.is_type_only = type_only || spec.is_type_only;
            decls.exports.push_back(std::move(exp));
        }
        return k;
    }

    if (ts.at(k).is_word("declare") || ts.at(k).is_word("interface") || ts.at(k).is_word("namespace") ||
        ts.at(k).is_word("module") || ts.at(k).is_word("import"))
        return k;

    if (ts.at(k).is_word("const") && ts.at(k + 1).is_word("enum")) {
        ++k;
    }
    if (ts.at(k).is_word("const") || ts.at(k).is_word("let") || ts.at(k).is_word("var"))
        return read_declarators(ts, k + 1, add_named);

    if (ts.at(k).is_word("async"))
        ++k;
    if (ts.at(k).is_word("abstract"))
        ++k;
    if (ts.at(k).is_word("function") || ts.at(k).is_word("class") || ts.at(k).is_word("enum")) {
        size_t name = ts.at(k + 1).is("*") ? k + 2 : k + 1;
        if (ts.at(name).is_identifier())
            add_named(ts.at(name).text);
        return name;
    }
    return k;
}

// A name bound inside a call's argument span and the token range it is visible in.
struct LocalBinding {
    std::string_view name;
    size_t first;
    size_t last;
};

// Index of the ',' ending the list element at `k`, or `close`.
size_t next_element(const TokenStream &ts, size_t k, size_t close) {
    while (k < close && !ts.at(k).is(","))
        k = ts.partner(k) != TokenStream::npos ? group_end(ts, k) : k + 1;
    return k;
}

// Reads one binding target (name, object or array pattern) with its type annotation and
// default value, appending the bound names. Returns the index after it.
size_t read_binding(const TokenStream &ts, size_t i, std::vector<std::string_view> &names) {
    if (ts.at(i).is("..."))
        ++i;
    const Token &tok = ts.at(i);
    if (tok.is_identifier()) {
        names.push_back(tok.text);
        ++i;
    } else if (tok.is("{")) {
        size_t close = ts.partner(i);
        for (size_t k = i + 1; k < close; k = next_element(ts, k, close) + 1) {
            if (ts.at(k).is("...")) {
                k = read_binding(ts, k, names);
                continue;
            }
            size_t after = ts.at(k).is("[") ? group_end(ts, k) : k + 1;
            if (ts.at(after).is(":")) {
                k = read_binding(ts, after + 1, names);
            } else {
                if (ts.at(k).is_identifier())
                    names.push_back(ts.at(k).text);
                k = ts.at(after).is("=") ? expression_end(ts, after + 1) : after;
            }
        }
        i = close + 1;
    } else if (tok.is("[")) {
        size_t close = ts.partner(i);
        for (size_t k = i + 1; k < close; k = next_element(ts, k, close) + 1) {
            if (!ts.at(k).is(","))
                k = read_binding(ts, k, names);
        }
        i = close + 1;
    } else {
        return i;
    }
    if (ts.at(i).is("?"))
        ++i;
    if (ts.at(i).is(":"))
        i = skip_type(ts, i + 1);
    if (ts.at(i).is("="))
        i = expression_end(ts, i + 1);
    return i;
}

void read_params(const TokenStream &ts, size_t open, std::vector<std::string_view> &names) {
    static constexpr std::array PARAMETER_MODIFIERS = {"public", "private", "protected", "readonly", "override"};
    size_t close = ts.partner(open);
    for (size_t k = open + 1; k < close; k = next_element(ts, k, close) + 1) {
        while (ts.at(k).is_identifier() &&
               std::ranges::find(PARAMETER_MODIFIERS, ts.at(k).text) != PARAMETER_MODIFIERS.end() &&
               (ts.at(k + 1).is_identifier() || ts.at(k + 1).is("{") || ts.at(k + 1).is("[")))
            ++k;
        k = read_binding(ts, k, names);
    }
}

// Last token of the body of the arrow function whose "=>" is at `arrow`.
size_t arrow_body_last(const TokenStream &ts, size_t arrow) {
    size_t body = arrow + 1;
    if (ts.at(body).is("{"))
        return ts.partner(body);
    size_t end = expression_end(ts, body);
    return end > body ? end - 1 : body;
}

bool is_control_keyword(std::string_view word) {
    return word == "if" || word == "while" || word == "for" || word == "switch" || word == "with" ||
           word == "catch";
}

// Parameters and declarations inside (open, close). Declarations are visible in their
// enclosing bracket group; those in a `for (...)` header also cover the loop body.
std::vector<LocalBinding> local_bindings(const TokenStream &ts, size_t open, size_t close) {
    std::vector<LocalBinding> out;
    std::vector<std::string_view> names;
    auto bind = [&](size_t first, size_t last) {
        for (std::string_view name : names)
            out.push_back({name, first, last});
        names.clear();
    };

    std::vector<size_t> groups{open};
    for (size_t k = open + 1; k < close; ++k) {
        while (groups.size() > 1 && k > ts.partner(groups.back()))
            groups.pop_back();
        const Token &tok = ts.at(k);
        const Token &prev = ts.at(k - 1);
        const Token &next = ts.at(k + 1);

        if (tok.is_identifier() && !prev.is(".") && !prev.is("?.")) {
            size_t scope = groups.back();
            size_t last = ts.partner(scope);
            if (ts.at(scope).is("(") && scope > 0 && ts.at(scope - 1).is_word("for")) {
                size_t body = last + 1;
                last = ts.at(body).is("{") ? ts.partner(body) : std::max(expression_end(ts, body), body + 1) - 1;
            }

            if ((tok.text == "const" || tok.text == "let" || tok.text == "var") &&
                (next.is_identifier() || next.is("{") || next.is("["))) {
                for (size_t n = k + 1;; ++n) {
                    n = read_binding(ts, n, names);
                    if (!ts.at(n).is(","))
                        break;
                }
                bind(scope, last);
            } else if (tok.text == "function" || tok.text == "class") {
                size_t n = next.is("*") ? k + 2 : k + 1;
                if (ts.at(n).is_identifier() && !ts.at(n).is_word("extends") && !ts.at(n).is_word("implements")) {
                    names.push_back(ts.at(n).text);
                    bind(scope, last);
                }
            } else if (next.is("=>") && !next.newline_before && !is_reserved_word(tok.text)) {
                names.push_back(tok.text);
                bind(k, arrow_body_last(ts, k + 1));
            }
        }

        if (tok.is("(")) {
            if (size_t arrow = arrow_after_params(ts, k); arrow != TokenStream::npos) {
                read_params(ts, k, names);
                bind(k, arrow_body_last(ts, arrow));
            } else if (prev.is_word("catch")) {
                read_params(ts, k, names);
                size_t body = group_end(ts, k);
                bind(k, ts.at(body).is("{") ? ts.partner(body) : body);
            } else if ((prev.is_identifier() && !is_control_keyword(prev.text)) || prev.is(">") || prev.is("*")) {
                size_t body = after_signature(ts, k);
                if (ts.at(body).is("{")) {
                    read_params(ts, k, names);
                    bind(k, ts.partner(body));
                }
            }
        }

        if (ts.partner(k) != TokenStream::npos && (tok.is("(") || tok.is("[") || tok.is("{")))
            groups.push_back(k);
    }
    return out;
}

bool starts_function_literal(const TokenStream &ts, size_t i) {
    if (ts.at(i).is_word("async") && !ts.at(i + 1).newline_before &&
        (ts.at(i + 1).is_word("function") || ts.at(i + 1).is("(") || ts.at(i + 1).is("<") ||
         (ts.at(i + 1).is_identifier() && ts.at(i + 2).is("=>"))))
        ++i;
    const Token &tok = ts.at(i);
    if (tok.is_word("function"))
        return true;
    if (tok.is_identifier() && !is_reserved_word(tok.text) && ts.at(i + 1).is("=>"))
        return true;
    if (tok.is("<")) {
        i = skip_angles(ts, i);
        if (i == TokenStream::npos)
            return false;
    }
    return ts.at(i).is("(") && arrow_after_params(ts, i) != TokenStream::npos;
}

std::string_view argument_type(const Token &tok) {
    switch (tok.kind) {
    case TokenKind::String:
    case TokenKind::Template:
    case TokenKind::TemplateHead:
        return "string";
    case TokenKind::Number:
        return "number";
    default:
        break;
    }
    if (tok.is("{"))
        return "object";
    if (tok.is("["))
        return "array";
    if (tok.is_word("null"))
        return "null";
    if (tok.is_word("true") || tok.is_word("false"))
        return "boolean";
    return "unknown";
}

SourceLocation location_of(const Token &tok) {
    return {tok.line, tok.column};
}

} // namespace

std::string_view key_text(const Token &tok) {
    if (tok.kind == TokenKind::String && tok.text.size() >= 2)
        return tok.text.substr(1, tok.text.size() - 2);
    return tok.text;
}

ModuleDeclarations read_module_declarations(const TokenStream &ts) {
    ModuleDeclarations decls;
    auto add_root = [&](std::string_view name) { decls.root_bindings.emplace_back(name); };

    size_t k = 0;
    while (ts.at(k).kind != TokenKind::End) {
        const Token &tok = ts.at(k);
        if (tok.is_identifier() && at_statement_start(ts, k)) {
            const Token &next = ts.at(k + 1);
            if (tok.text == "import" && !next.is("(") && !next.is(".")) {
                k = read_import(ts, k, decls);
                continue;
            }
            if (tok.text == "export") {
                k = read_export(ts, k, decls);
                continue;
            }
            if (tok.text == "const" && next.is_word("enum") && ts.at(k + 2).is_identifier()) {
                add_root(ts.at(k + 2).text);
                k += 3;
                continue;
            }
            if ((tok.text == "const" || tok.text == "var" || tok.text == "let") &&
                (next.is_identifier() || next.is("{") || next.is("["))) {
                k = read_declarators(ts, k + 1, add_root);
                continue;
            }
            size_t decl = k;
            if (tok.text == "async" || tok.text == "abstract")
                ++decl;
            if (ts.at(decl).is_word("function") || ts.at(decl).is_word("class") || ts.at(decl).is_word("enum")) {
                size_t name = ts.at(decl + 1).is("*") ? decl + 2 : decl + 1;
                if (ts.at(name).is_identifier() && !ts.at(name).is_word("extends") &&
                    !ts.at(name).is_word("implements"))
                    add_root(ts.at(name).text);
                k = name;
                continue;
            }
        }
        k = ts.partner(k) != TokenStream::npos ? group_end(ts, k) : k + 1;
    }
    return decls;
}

size_t skip_postfix_chain(const TokenStream &ts, size_t close) {
    size_t k = close + 1;
    while (true) {
        const Token &tok = ts.at(k);
        if (tok.is(".") || tok.is("?.")) {
            const Token &next = ts.at(k + 1);
            if (tok.is("?.") && (next.is("(") || next.is("["))) {
                ++k;
            } else if (next.is_identifier() || next.kind == TokenKind::PrivateName) {
                k += 2;
            } else {
                return k;
            }
        } else if (tok.is("(") || tok.is("[") || tok.kind == TokenKind::TemplateHead) {
            k = group_end(ts, k);
        } else if (tok.kind == TokenKind::Template) {
            ++k;
        } else if (tok.is("!") && !tok.newline_before) {
            ++k;
        } else if (tok.is("<")) {
            size_t after = type_arguments_end(ts, k);
            if (after == TokenStream::npos)
                return k;
            k = after;
        } else {
            return k;
        }
    }
}

ModuleCollector::ModuleCollector(const TokenStream &ts, std::string_view file_path, const AnalyzerOptions &options)
    : ts_(ts), file_path_(file_path), decls_(read_module_declarations(ts)) {
    if (!options.is_entry_import)
        return;
    for (size_t n = 0; n < decls_.imports.size(); ++n) {
        const ModuleImport &imp = decls_.imports[n];
        if (imp.is_type_only || !options.is_entry_import(file_path_, imp.source))
            continue;
        SourceLocation at = location_of(ts_.at(decls_.import_tokens[n]));
        if (imp.kind == ImportKind::Named && imp.imported == options.entry_binding) {
            namespaces_.insert(imp.local);
        } else if (imp.kind == ImportKind::Default) {
            import_diagnostics_.push_back(
                {.code = DiagnosticCode::DefaultImport,
                 .severity = Severity::Warning,
                 .location = at,
                 .message = std::format("default import '{}' from \"{}\" is ignored; import {{ {} }} instead", imp.local,
                                        imp.source, options.entry_binding)});
        } else if (imp.kind == ImportKind::Namespace) {
            import_diagnostics_.push_back(
                {.code = DiagnosticCode::StarImport,
                 .severity = Severity::Warning,
                 .location = at,
                 .message = std::format("namespace import '{}' from \"{}\" is ignored; import {{ {} }} instead",
                                        imp.local, imp.source, options.entry_binding)});
        }
    }
}

void ModuleCollector::record(const CallSite &site) {
    if (std::optional<uint32_t> field = paths_.class_field()) {
        if (class_fields_.insert(*field).second) {
            const Token &ns = ts_.at(site.ns);
            class_field_diagnostics_.push_back(
                {.code = DiagnosticCode::ClassProperty,
                 .severity = Severity::Error,
                 .location = location_of(ns),
                 .message = std::format("{}.{}(...) in a class field initializer is not collected", ns.text,
                                        ts_.at(site.ns + 2).text)});
        }
        return;
    }
    pending_.push_back({site, paths_.register_definition()});
}

std::vector<std::string> ModuleCollector::collect_refs(const Pending &pending) const {
    std::unordered_set<std::string_view> candidates;
    for (const ModuleImport &imp : decls_.imports) {
        if (!imp.is_type_only)
            candidates.insert(imp.local);
    }
    for (const std::string &name : decls_.root_bindings)
        candidates.insert(name);
    for (const std::string &ns : namespaces_)
        candidates.erase(ns);
    if (pending.path.root_binding)
        candidates.erase(*pending.path.root_binding);

    std::vector<LocalBinding> locals = local_bindings(ts_, pending.site.open, pending.site.close);
    auto shadowed = [&locals](std::string_view name, size_t k) {
        return std::ranges::any_of(
            locals, [&](const LocalBinding &local) { return local.name == name && local.first <= k && k <= local.last; });
    };

    std::vector<std::string> refs;
    for (size_t k = pending.site.open + 1; k < pending.site.close; ++k) {
        const Token &tok = ts_.at(k);
        if (!tok.is_identifier() || !candidates.contains(tok.text) || shadowed(tok.text, k))
            continue;
        const Token &prev = ts_.at(k - 1);
        if (prev.is(".") || prev.is("?."))
            continue;
        if ((prev.is("{") || prev.is(",") || prev.is("(")) && ts_.at(k + 1).is(":"))
            continue;
        if (std::ranges::find(refs, tok.text) == refs.end())
            refs.emplace_back(tok.text);
    }
    return refs;
}

ModuleAnalysis ModuleCollector::finish() {
    ExportBindings bindings(decls_.exports);
    ModuleAnalysis out;
    out.file_path = file_path_;
    for (const Pending &p : pending_) {
        Definition def;
        def.ast_path = p.path.ast_path;
        def.is_top_level = p.path.is_top_level;
        if (def.is_top_level && p.path.root_binding) {
            def.export_binding = bindings.find(*p.path.root_binding);
            def.is_exported = def.export_binding.has_value();
        }
        def.expression = std::string(ts_.slice(p.site.ns, p.site.close));
        def.schema = std::string(ts_.at(p.site.ns + 2).text);
        def.dependency_refs = collect_refs(p);
        def.location = {ts_.at(p.site.ns).line, ts_.at(p.site.ns).column};
        out.definitions.push_back(std::move(def));
    }
    out.imports = decls_.imports;
    out.exports = decls_.exports;
    out.diagnostics = import_diagnostics_;
    std::vector<Diagnostic> calls = call_diagnostics();
    out.diagnostics.insert(out.diagnostics.end(), calls.begin(), calls.end());
    out.diagnostics.insert(out.diagnostics.end(), class_field_diagnostics_.begin(), class_field_diagnostics_.end());
    return out;
}

std::vector<Diagnostic> ModuleCollector::call_diagnostics() const {
    std::vector<Diagnostic> out;
    if (namespaces_.empty())
        return out;

    auto add = [&](DiagnosticCode code, size_t at, std::string message) {
        out.push_back({.code = code, .severity = Severity::Error, .location = location_of(ts_.at(at)),
                       .message = std::move(message)});
    };
    auto is_member_name = [&](size_t k) { return k > 0 && (ts_.at(k - 1).is(".") || ts_.at(k - 1).is("?.")); };

    for (size_t k = 0; k + 1 < ts_.size(); ++k) {
        const Token &tok = ts_.at(k);

        // `(x || gql).default(...)`: the namespace used as a value inside a parenthesized callee.
        if (tok.is("(") && (k == 0 || !ends_operand(ts_.at(k - 1)) ||
                            (ts_.at(k - 1).is_identifier() && is_reserved_word(ts_.at(k - 1).text)))) {
            size_t close = ts_.partner(k);
            size_t after = close + 1;
            if (ts_.at(after).is(".") && ts_.at(after + 1).is_identifier() && ts_.at(after + 2).is("(")) {
                for (size_t n = k + 1; n < close; ++n) {
                    const Token &inner = ts_.at(n);
                    const Token &follow = ts_.at(n + 1);
                    if (inner.is_identifier() && is_namespace(inner.text) && !is_member_name(n) && !follow.is(".") &&
                        !follow.is("?.") && !follow.is("[") && !follow.is("(")) {
                        add(DiagnosticCode::DynamicCallee, k,
                            std::format("'{}' is used inside a computed callee; call {}.{}(...) directly", inner.text,
                                        inner.text, ts_.at(after + 1).text));
                        break;
                    }
                }
            }
            continue;
        }

        if (!tok.is_identifier() || !is_namespace(tok.text) || is_member_name(k) ||
            (k > 0 && ts_.at(k - 1).is_word("new")))
            continue;
        const Token &next = ts_.at(k + 1);
        if (next.is("(")) {
            add(DiagnosticCode::NonMemberCallee, k,
                std::format("'{}' cannot be called directly; call a member such as {}.default(...)", tok.text, tok.text));
        } else if (next.is("?.") && ts_.at(k + 2).is_identifier() && ts_.at(k + 3).is("(")) {
            add(DiagnosticCode::OptionalChaining, k,
                std::format("optional chaining on '{}' is not supported; use {}.{}(...)", tok.text, tok.text,
                            ts_.at(k + 2).text));
        } else if (next.is("[") && ts_.at(group_end(ts_, k + 1)).is("(")) {
            add(DiagnosticCode::ComputedProperty, k,
                std::format("computed member access on '{}' is not supported", tok.text));
        } else if (next.is(".") && ts_.at(k + 2).is_identifier()) {
            size_t open = k + 3;
            if (ts_.at(open).is("<"))
                open = type_arguments_end(ts_, open);
            if (open == TokenStream::npos || !ts_.at(open).is("("))
                continue;
            if (std::optional<Diagnostic> found = check_arguments(k, open))
                out.push_back(std::move(*found));
        }
    }
    return out;
}

std::optional<Diagnostic> ModuleCollector::check_arguments(size_t ns, size_t open) const {
    std::string callee = std::format("{}.{}", ts_.at(ns).text, ts_.at(ns + 2).text);
    auto diagnostic = [&](DiagnosticCode code, std::string message) {
        return Diagnostic{.code = code, .severity = Severity::Error, .location = location_of(ts_.at(ns)),
                          .message = std::move(message)};
    };

    size_t close = ts_.partner(open);
    size_t first = open + 1;
    if (first == close)
        return diagnostic(DiagnosticCode::MissingArgument, std::format("{}() needs a factory argument", callee));
    if (ts_.at(first).is("..."))
        return diagnostic(DiagnosticCode::SpreadArgument,
                          std::format("{}(...) does not accept a spread argument", callee));
    if (!starts_function_literal(ts_, first))
        return diagnostic(DiagnosticCode::InvalidArgumentType,
                          std::format("{} expects a factory function, got {}", callee, argument_type(ts_.at(first))));

    size_t extra = 0;
    size_t k = expression_end(ts_, first);
    while (ts_.at(k).is(",") && k + 1 < close) {
        ++extra;
        k = std::max(expression_end(ts_, k + 1), k + 2);
    }
    if (extra > 0)
        return diagnostic(DiagnosticCode::ExtraArguments,
                          std::format("{} takes one factory argument, got {} more", callee, extra));
    return std::nullopt;
}

bool is_key_token(const Token &tok) {
    return tok.kind == TokenKind::Identifier || tok.kind == TokenKind::String || tok.kind == TokenKind::Number ||
           tok.kind == TokenKind::PrivateName;
}

bool is_member_modifier(const TokenStream &ts, size_t i, bool in_class) {
    static constexpr std::array CLASS_MODIFIERS = {
        "static", "public", "private", "protected", "readonly", "abstract",
        "override", "declare", "async", "get", "set", "accessor",
    };
    const Token &tok = ts.at(i);
    if (!tok.is_identifier())
        return false;
    bool listed = in_class ? std::ranges::find(CLASS_MODIFIERS, tok.text) != CLASS_MODIFIERS.end()
                           : tok.text == "async" || tok.text == "get" || tok.text == "set";
    if (!listed)
        return false;
    const Token &next = ts.at(i + 1);
    if (tok.text == "async" && next.newline_before)
        return false;
    return is_key_token(next) || next.is("[") || next.is("*");
}

bool is_index_signature(const TokenStream &ts, size_t open) {
    return ts.at(open + 1).is_identifier() && ts.at(open + 2).is(":");
}

size_t after_signature(const TokenStream &ts, size_t open) {
    size_t k = group_end(ts, open);
    if (ts.at(k).is(":"))
        k = skip_type(ts, k + 1);
    return k;
}

bool is_jsx_path(std::string_view file_path) {
    return file_path.ends_with(".tsx") || file_path.ends_with(".jsx");
}

ParseError to_parse_error(std::string_view file_path, const LexError &err) {
    return ParseError{.file_path = std::string(file_path), .line = err.line, .column = err.column, .message = err.message};
}

ParseError to_parse_error(std::string_view file_path, const TokenStream &ts, const SyntaxError &err) {
    const Token &at = ts.at(err.token);
    return ParseError{.file_path = std::string(file_path), .line = at.line, .column = at.column, .message = err.message};
}

std::string_view diagnostic_code_name(DiagnosticCode code) {
    switch (code) {
    case DiagnosticCode::DefaultImport:
        return "DEFAULT_IMPORT";
    case DiagnosticCode::StarImport:
        return "STAR_IMPORT";
    case DiagnosticCode::NonMemberCallee:
        return "NON_MEMBER_CALLEE";
    case DiagnosticCode::OptionalChaining:
        return "OPTIONAL_CHAINING";
    case DiagnosticCode::ComputedProperty:
        return "COMPUTED_PROPERTY";
    case DiagnosticCode::DynamicCallee:
        return "DYNAMIC_CALLEE";
    case DiagnosticCode::MissingArgument:
        return "MISSING_ARGUMENT";
    case DiagnosticCode::SpreadArgument:
        return "SPREAD_ARGUMENT";
    case DiagnosticCode::InvalidArgumentType:
        return "INVALID_ARGUMENT_TYPE";
    case DiagnosticCode::ExtraArguments:
        return "EXTRA_ARGUMENTS";
    case DiagnosticCode::ClassProperty:
        return "CLASS_PROPERTY";
    }
    return "UNKNOWN";
}

} // namespace kiln
