#ifndef MKWL_ERRORS_HPP
#define MKWL_ERRORS_HPP

#include <stdexcept>

// Thrown when a proof is requested for a leaf or index that is not in the tree
class NotFoundError : public std::out_of_range
{
public:
    using std::out_of_range::out_of_range;
};

#endif
