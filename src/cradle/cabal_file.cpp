#include <hiecore/cradle/cabal_file.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace hiecore {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

static bool is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

// "key: value" -> (key, value)
static bool split_field_line(const std::string& content, std::string& key, std::string& value) {
    size_t colon = content.find(':');
    if (colon == std::string::npos || colon == 0) return false;

    std::string k = trim(content.substr(0, colon));
    if (k.empty() || !std::all_of(k.begin(), k.end(), is_key_char)) return false;

    key = to_lower(k);
    value = trim(content.substr(colon + 1));
    return true;
}

static bool is_conditional(const std::string& content) {
    std::string lower = to_lower(content);
    return lower.rfind("if ", 0) == 0 || lower.rfind("if(", 0) == 0 ||
           lower == "else" || lower.rfind("else ", 0) == 0 ||
           lower.rfind("elif ", 0) == 0;
}

static CabalStanza make_stanza(const std::string& header, int line) {
    CabalStanza st;
    st.line = line;

    size_t sp = header.find_first_of(" \t");
    std::string word = to_lower(header.substr(0, sp));
    std::string rest = sp == std::string::npos ? "" : trim(header.substr(sp));
    if (!rest.empty() && rest.back() == '{') rest = trim(rest.substr(0, rest.size() - 1));

    if (word == "library") st.kind = StanzaKind::Library;
    else if (word == "foreign-library") st.kind = StanzaKind::ForeignLibrary;
    else if (word == "executable") st.kind = StanzaKind::Executable;
    else if (word == "test-suite") st.kind = StanzaKind::TestSuite;
    else if (word == "benchmark") st.kind = StanzaKind::Benchmark;
    else if (word == "common") st.kind = StanzaKind::Common;
    else if (word == "custom-setup") st.kind = StanzaKind::CustomSetup;
    else st.kind = StanzaKind::Other;

    st.name = rest;
    return st;
}

static std::string join_values(const std::vector<CabalField>& fields, const std::string& key) {
    std::string out;
    for (const auto& [k, v] : fields) {
        if (k != key) continue;
        if (!out.empty()) out += '\n';
        out += v;
    }
    return out;
}

// ---------------------------------------------------------------------------
// CabalStanza
// ---------------------------------------------------------------------------

bool CabalStanza::has_field(const std::string& key) const {
    return std::any_of(fields.begin(), fields.end(),
        [&](const CabalField& f) { return f.first == key; });
}

std::string CabalStanza::field(const std::string& key) const {
    return join_values(fields, key);
}

bool CabalStanza::is_buildable() const {
    for (const auto& [k, v] : fields) {
        if (k == "buildable" && to_lower(trim(v)) == "false") return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// CabalFile
// ---------------------------------------------------------------------------

Result<CabalFile> CabalFile::parse(const std::string& text, const std::string& origin) {
    CabalFile file;
    file.path = origin;

    CabalStanza* stanza = nullptr;
    std::vector<CabalField>* field_target = nullptr;
    std::string field_key, field_value;
    size_t field_indent = 0;
    bool in_field = false;

    auto finish_field = [&]() {
        if (in_field && field_target) {
            field_target->emplace_back(field_key, trim(field_value));
        }
        in_field = false;
    };

    std::istringstream in(text);
    std::string raw;
    int line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();

        size_t indent = raw.find_first_not_of(" \t");
        if (indent == std::string::npos) continue;
        std::string content = trim(raw.substr(indent));
        if (content.rfind("--", 0) == 0) continue;

        if (in_field && indent > field_indent) {
            field_value += '\n';
            field_value += content;
            continue;
        }
        finish_field();

        if (content == "{" || content == "}") continue;

        std::string key, value;
        if (indent == 0) {
            if (split_field_line(content, key, value)) {
                stanza = nullptr;
                field_target = &file.top_fields;
            } else {
                file.stanzas.push_back(make_stanza(content, line_no));
                stanza = &file.stanzas.back();
                continue;
            }
        } else {
            if (is_conditional(content)) continue;
            if (!split_field_line(content, key, value)) {
                return HieError{HieError::Parse,
                    "unexpected line in cabal file: '" + content + "'",
                    "expected 'field: value', a stanza header or a conditional",
                    origin, line_no};
            }
            field_target = stanza ? &stanza->fields : &file.top_fields;
        }

        field_key = key;
        field_value = value;
        field_indent = indent;
        in_field = true;
    }
    finish_field();

    return Result<CabalFile>::ok(std::move(file));
}

Result<CabalFile> CabalFile::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return HieError{HieError::IO, "cannot open: " + path};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return CabalFile::parse(ss.str(), path);
}

std::string CabalFile::field(const std::string& key) const {
    return join_values(top_fields, key);
}

std::string CabalFile::package_name() const {
    return trim(field("name"));
}

const CabalStanza* CabalFile::find_common(const std::string& name) const {
    for (const auto& st : stanzas) {
        if (st.kind == StanzaKind::Common && st.name == name) return &st;
    }
    return nullptr;
}

static Status splice_imports(const CabalFile& file, const CabalStanza& stanza,
                             std::vector<CabalField>& out, int depth) {
    if (depth > 16) {
        return HieError{HieError::Parse,
            "common stanza imports nest too deeply (cycle?)", "", file.path, stanza.line};
    }
    for (const auto& [k, v] : stanza.fields) {
        if (k != "import") {
            out.emplace_back(k, v);
            continue;
        }
        for (const auto& name : split_field_list(v)) {
            const CabalStanza* common = file.find_common(name);
            if (!common) {
                return HieError{HieError::Parse,
                    "unknown common stanza '" + name + "'", "", file.path, stanza.line};
            }
            HIECORE_TRY(splice_imports(file, *common, out, depth + 1));
        }
    }
    return ok_status();
}

Result<CabalStanza> CabalFile::resolve_imports(const CabalStanza& stanza) const {
    CabalStanza resolved = stanza;
    resolved.fields.clear();
    HIECORE_TRY(splice_imports(*this, stanza, resolved.fields, 0));
    return Result<CabalStanza>::ok(std::move(resolved));
}

// ---------------------------------------------------------------------------
// Value splitting
// ---------------------------------------------------------------------------

std::vector<std::string> split_field_list(const std::string& value) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : value) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::vector<std::string> split_words(const std::string& value) {
    std::vector<std::string> out;
    std::istringstream in(value);
    std::string word;
    while (in >> word) out.push_back(word);
    return out;
}

std::vector<std::string> dependency_names(const std::string& build_depends) {
    std::vector<std::string> out;
    std::string item;
    std::string flat = build_depends;
    std::replace(flat.begin(), flat.end(), '\n', ',');

    std::istringstream in(flat);
    while (std::getline(in, item, ',')) {
        std::string t = trim(item);
        size_t end = 0;
        while (end < t.size() &&
               (std::isalnum(static_cast<unsigned char>(t[end])) || t[end] == '-')) {
            ++end;
        }
        std::string name = t.substr(0, end);
        if (!name.empty() && std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(name);
        }
    }
    return out;
}

} // namespace hiecore
