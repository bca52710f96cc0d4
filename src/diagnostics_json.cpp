#include "pmatch/diagnostics_json.hpp"
#include "pmatch/env.hpp"
#include <sstream>
#include <cstdio>
#include <iostream>

namespace pmatch {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_strings_json(std::ostringstream& os, const std::vector<std::string>& xs){
    os<<"[";
    for(size_t i=0;i<xs.size(); ++i){ if(i) os<<","; os<<json_escape(xs[i]); }
    os<<"]";
}

std::string warnings_to_json(const std::vector<MatchWarning>& ws){
    std::ostringstream os;
    os<<"{\"warnings\":[";
    for(size_t i=0;i<ws.size(); ++i){
        const auto &w=ws[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(w.code)
            <<",\"message\":"<<json_escape(w.message)
            <<",\"hint\":"<<json_escape(w.hint)
            <<",\"clause\":"<<w.clause_index
            <<",\"line\":"<<w.line
            <<",\"col\":"<<w.col
            <<"}";
    }
    os<<"]}";
    return os.str();
}

std::string error_to_json(const pmatch_error& e){
    std::ostringstream os;
    os<<"{\"code\":"<<json_escape(e.code)<<",\"message\":"<<json_escape(e.what());
    if(auto* u = dynamic_cast<const unknown_variant_error*>(&e)){
        os<<",\"variant\":"<<json_escape(u->variant)<<",\"suggestions\":";
        append_strings_json(os,u->suggestions);
    } else if(auto* a = dynamic_cast<const arity_mismatch_error*>(&e)){
        os<<",\"variant\":"<<json_escape(a->variant)<<",\"expected\":"<<a->expected<<",\"actual\":"<<a->actual;
    } else if(auto* f = dynamic_cast<const field_type_error*>(&e)){
        os<<",\"variant\":"<<json_escape(f->variant)<<",\"field\":"<<f->field_index
          <<",\"expected\":"<<json_escape(f->expected)<<",\"actual\":"<<json_escape(f->actual);
    } else if(auto* p = dynamic_cast<const pattern_error*>(&e)){
        os<<",\"line\":"<<p->line<<",\"col\":"<<p->col;
    } else if(auto* n = dynamic_cast<const no_match_error*>(&e)){
        os<<",\"subject\":"<<json_escape(n->subject_tag);
    }
    os<<"}";
    return os.str();
}

void maybe_print_json(const std::vector<MatchWarning>& ws){
    if(detect_env().diagJson){
        auto js=warnings_to_json(ws);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

void report_warnings(const std::vector<MatchWarning>& ws){
    if(ws.empty()) return;
    if(detect_env().warnings){
        for(auto& w : ws){
            std::cerr << "[pmatch][warn] " << w.code << " clause " << w.clause_index << ": " << w.message;
            if(w.line>=0) std::cerr << " (line " << w.line << ", col " << w.col << ")";
            if(!w.hint.empty()) std::cerr << " hint: " << w.hint;
            std::cerr << "\n";
        }
    }
    maybe_print_json(ws);
}

} // namespace pmatch
