#include "filter/compose.hpp"

namespace pw {

namespace {

void require_operands(const FilterPtr& a, const FilterPtr& b, const char* who) {
    if (!a || !b) {
        throw FilterError(FilterErrc::InvalidComposition, std::string(who) + " requires two filters");
    }
}

// Join 与 AndThen 的两个操作数最多只有一个存中间图像。
void require_single_intermediate(const FilterPtr& a, const FilterPtr& b, const char* who) {
    if (a->uses_intermediate_image() && b->uses_intermediate_image()) {
        throw FilterError(FilterErrc::InvalidComposition,
                          std::string(who) + ": both operands store an intermediate image (" +
                          a->name() + ", " + b->name() + ")");
    }
}

// 存中间图像的操作数在 Input 的私有副本上准备，兄弟操作数继续读取原来的缓存与源图像
void prepare_operand(const FilterPtr& op, Input& input, const Image& output) {
    if (!op->uses_intermediate_image()) {
        op->before_compute(input, output);
        return;
    }
    auto own = std::make_shared<Input>(input);
    op->before_compute(*own, output);
    input.set_operand_input(op.get(), std::move(own));
}

} // namespace

// ---------------------------------------------------------------- Then

Then::Then(FilterPtr a, FilterPtr b) : a_(std::move(a)), b_(std::move(b)), materialize_(false) {
    require_operands(a_, b_, "then");
    materialize_ = b_->requires_intermediate_image();
}

void Then::compute_at(const Point& pt, const Input& input, Pixel& dest) const {
    if (materialize_) {
        b_->compute_at(pt, input, dest);
        return;
    }
    Pixel scratch = dest;
    a_->compute_at(pt, input, scratch);
    b_->compute_at(pt, input.with_pixel(scratch), dest);
}

bool Then::requires_intermediate_image() const {
    return a_->requires_intermediate_image() || b_->requires_intermediate_image();
}

bool Then::uses_intermediate_image() const {
    return materialize_ || a_->uses_intermediate_image();
}

void Then::before_compute(Input& input, const Image& output) const {
    if (!materialize_) {
        a_->before_compute(input, output);
        b_->before_compute(input, output);
        return;
    }
    // a 在私有的 Input 副本上准备，避免它的缓存与我们的中间图像互相覆盖
    Input a_input = input;
    a_->before_compute(a_input, output);
    auto intermediate = std::make_shared<Image>(output.new_like_with_type(DataType::FLOAT32));
    compute_image(*a_, a_input, *intermediate);
    input.set_image(std::move(intermediate));
    b_->before_compute(input, output);
}

std::string Then::name() const {
    return "then(" + a_->name() + "," + b_->name() + ")";
}

// ---------------------------------------------------------------- Join

Join::Join(FilterPtr a, FilterPtr b, Color working, JoinFn fn)
    : a_(std::move(a)), b_(std::move(b)), working_(working), fn_(std::move(fn)) {
    require_operands(a_, b_, "join");
    if (!fn_) throw FilterError(FilterErrc::InvalidParameter, "join requires a combine function");
    require_single_intermediate(a_, b_, "join");
}

void Join::compute_at(const Point& pt, const Input& input, Pixel& dest) const {
    Pixel pa = dest.convert(working_);
    Pixel pb = pa;
    a_->compute_at(pt, input.for_operand(a_.get()), pa);
    b_->compute_at(pt, input.for_operand(b_.get()), pb);
    fn_(pt, pa, pb).convert_to(dest);
}

bool Join::requires_intermediate_image() const {
    return a_->requires_intermediate_image() || b_->requires_intermediate_image();
}

bool Join::uses_intermediate_image() const {
    return a_->uses_intermediate_image() || b_->uses_intermediate_image();
}

void Join::before_compute(Input& input, const Image& output) const {
    prepare_operand(a_, input, output);
    prepare_operand(b_, input, output);
}

std::string Join::name() const {
    return "join(" + a_->name() + "," + b_->name() + ")";
}

// ---------------------------------------------------------------- AndThen

AndThen::AndThen(FilterPtr a, FilterPtr b) : a_(std::move(a)), b_(std::move(b)) {
    require_operands(a_, b_, "and_then");
    require_single_intermediate(a_, b_, "and_then");
}

void AndThen::compute_at(const Point& pt, const Input& input, Pixel& dest) const {
    a_->compute_at(pt, input.for_operand(a_.get()), dest);
    b_->compute_at(pt, input.for_operand(b_.get()), dest);
}

bool AndThen::requires_intermediate_image() const {
    return a_->requires_intermediate_image() || b_->requires_intermediate_image();
}

bool AndThen::uses_intermediate_image() const {
    return a_->uses_intermediate_image() || b_->uses_intermediate_image();
}

void AndThen::before_compute(Input& input, const Image& output) const {
    prepare_operand(a_, input, output);
    prepare_operand(b_, input, output);
}

std::string AndThen::name() const {
    return "and_then(" + a_->name() + "," + b_->name() + ")";
}

// ---------------------------------------------------------------- helpers

FilterPtr then(FilterPtr a, FilterPtr b) {
    return std::make_shared<Then>(std::move(a), std::move(b));
}

FilterPtr join(FilterPtr a, FilterPtr b, Color working, JoinFn fn) {
    return std::make_shared<Join>(std::move(a), std::move(b), working, std::move(fn));
}

FilterPtr and_then(FilterPtr a, FilterPtr b) {
    return std::make_shared<AndThen>(std::move(a), std::move(b));
}

FilterPtr chain(const std::vector<FilterPtr>& filters) {
    if (filters.empty()) throw FilterError(FilterErrc::InvalidComposition, "chain requires at least one filter");
    FilterPtr out = filters.front();
    for (size_t i = 1; i < filters.size(); ++i) out = then(out, filters[i]);
    return out;
}

} // namespace pw
