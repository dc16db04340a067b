#include "annotation_filter.hpp"

namespace gfaestus {

using namespace std;

bool FilterString::matches(const string& value) const {
    switch (op) {
    case StringOp::Equal:
        return value == arg;
    case StringOp::Contains:
        return value.find(arg) != string::npos;
    case StringOp::ContainedIn:
        return arg.find(value) != string::npos;
    case StringOp::NotContained:
        return value.find(arg) == string::npos;
    default:
        return true;
    }
}

}
