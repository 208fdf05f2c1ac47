#include "filter/filter.hpp"

namespace pw {

void compute_image(const Filter& filter, const Input& input, Image& output) {
    output.for_each([&](const Point& pt, Pixel& dest) {
        filter.compute_at(pt, input, dest);
    });
}

} // namespace pw
