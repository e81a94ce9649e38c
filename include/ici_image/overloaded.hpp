#ifndef ICI_IMAGE_OVERLOADED_HPP_
#define ICI_IMAGE_OVERLOADED_HPP_

namespace ici_image {

// Visitor built from a set of lambdas, one per variant alternative
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace ici_image

#endif // ICI_IMAGE_OVERLOADED_HPP_
