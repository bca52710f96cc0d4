// Joint subjects: N independent values matched position-wise by one ..(p1, ..., pn) pattern.
#pragma once
#include "pmatch/value.hpp"
#include <stdexcept>
#include <utility>
#include <vector>

namespace pmatch {

inline value_ptr zip_subject_list(std::vector<value_ptr> subjects){
    if(subjects.empty()) throw std::invalid_argument("zip_subjects: at least one subject required");
    for(auto& s : subjects) if(!s) throw std::invalid_argument("zip_subjects: null subject");
    return detail::make_value(tuple_value{std::move(subjects)});
}

// Shares the wrapped values; nothing is copied.
template<typename... Subjects>
value_ptr zip_subjects(Subjects&&... subjects){
    static_assert(sizeof...(Subjects) > 0, "zip_subjects needs at least one subject");
    return zip_subject_list(std::vector<value_ptr>{to_value(std::forward<Subjects>(subjects))...});
}

} // namespace pmatch
