#pragma once
#include "pmatch/edn.hpp"
#include <string>
#include <utility>
#include <vector>

namespace pmatch::surface_front {

// Expression lowering: one frame per open call; the root frame has no head.
struct expr_state {
    struct frame {
        node_ptr head;
        std::vector<node_ptr> elems;
        int line{0}, col{0};
    };
    std::vector<frame> frames = std::vector<frame>(1);

    void push(node_ptr n){ frames.back().elems.push_back(std::move(n)); }
};

// Declaration lowering: type name plus (variant, [(field, type)]) in order.
struct decl_state {
    struct field { std::string name; std::string type; };
    struct variant { std::string name; std::vector<field> fields; };
    std::string type_name;
    std::vector<variant> variants;
};

inline void set_pos(node& n, int line, int col){ n.metadata["line"] = line; n.metadata["col"] = col; }

// Unescape the body of a quoted literal (quotes included in `raw`).
inline std::string unquote(const std::string& raw){
    std::string out;
    for(size_t i=1;i+1<raw.size(); ++i){
        char c = raw[i];
        if(c=='\\' && i+2<raw.size()){
            char e = raw[++i];
            switch(e){ case 'n': out+='\n'; break; case 't': out+='\t'; break; case 'r': out+='\r'; break; default: out+=e; break; }
        } else out += c;
    }
    return out;
}

} // namespace pmatch::surface_front
