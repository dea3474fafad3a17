#include "suppression_policy.hpp"

Delivery decide_delivery(const DeliveryContext& ctx) {
    if (ctx.muted) return Delivery::StoreSilently;
    if (ctx.force_focus) return Delivery::FocusOnly;
    if (ctx.pane_visible) return Delivery::StoreOnly;
    return Delivery::StoreAndToast;
}

std::string to_string(Delivery delivery) {
    switch (delivery) {
        case Delivery::StoreSilently: return "stored_silently";
        case Delivery::FocusOnly: return "focus_only";
        case Delivery::StoreOnly: return "stored";
        case Delivery::StoreAndToast: return "toasted";
    }
    return "unknown";
}
