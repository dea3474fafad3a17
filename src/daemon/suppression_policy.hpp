#pragma once

#include <string>

enum class Delivery {
    StoreSilently, // muted: stored, no toast, no focus
    FocusOnly,     // force-focus: focus the pane, nothing stored
    StoreOnly,     // pane already in front: stored for the panel, no toast
    StoreAndToast,
};

struct DeliveryContext {
    bool muted = false;
    bool force_focus = false;
    bool pane_visible = false;
};

Delivery decide_delivery(const DeliveryContext& ctx);

std::string to_string(Delivery delivery);
