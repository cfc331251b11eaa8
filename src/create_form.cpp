/*
 * create_form.cpp - Device creation form implementation
 */

#include "create_form.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace {

std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

const std::map<std::string, std::vector<std::string>>& category_keywords() {
    static const std::map<std::string, std::vector<std::string>> keywords = {
        {"tablet", {"tablet", "pad"}},
        {"wear", {"wear", "watch"}},
        {"tv", {"tv"}},
        {"automotive", {"automotive", "auto"}},
        {"desktop", {"desktop"}}
    };
    return keywords;
}

bool matches_category(const Choice& choice, const std::string& category) {
    auto it = category_keywords().find(category);
    if (it == category_keywords().end()) {
        return false;
    }
    std::string haystack = to_lower(choice.id + " " + choice.display);
    for (const auto& keyword : it->second) {
        if (haystack.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* form_field_label(FormField field) {
    switch (field) {
        case FormField::API_LEVEL:    return "API Level";
        case FormField::CATEGORY:     return "Category";
        case FormField::DEVICE_TYPE:  return "Device Type";
        case FormField::RAM_SIZE:     return "RAM (MB)";
        case FormField::STORAGE_SIZE: return "Storage (MB)";
        case FormField::NAME:         return "Name";
    }
    return "";
}

std::vector<Choice> filter_device_types(const std::vector<Choice>& types, const std::string& category) {
    if (category == "all") {
        return types;
    }

    std::vector<Choice> filtered;
    for (const auto& choice : types) {
        bool keep;
        if (category == "phone") {
            keep = true;
            for (const auto& entry : category_keywords()) {
                if (matches_category(choice, entry.first)) {
                    keep = false;
                    break;
                }
            }
        } else {
            keep = matches_category(choice, category);
        }
        if (keep) {
            filtered.push_back(choice);
        }
    }
    return filtered;
}

CreateDeviceForm::CreateDeviceForm(Platform platform) : platform_(platform) {
    if (platform == Platform::ANDROID) {
        fields_ = {FormField::API_LEVEL, FormField::CATEGORY, FormField::DEVICE_TYPE,
                   FormField::RAM_SIZE, FormField::STORAGE_SIZE, FormField::NAME};
    } else {
        fields_ = {FormField::API_LEVEL, FormField::DEVICE_TYPE, FormField::NAME};
    }
}

const std::vector<std::string>& CreateDeviceForm::categories() {
    static const std::vector<std::string> list = {
        "all", "phone", "tablet", "wear", "tv", "automotive", "desktop"
    };
    return list;
}

void CreateDeviceForm::next_field() {
    active_field_ = (active_field_ + 1) % fields_.size();
}

void CreateDeviceForm::prev_field() {
    active_field_ = (active_field_ + fields_.size() - 1) % fields_.size();
}

void CreateDeviceForm::select_next() {
    switch (active_field()) {
        case FormField::API_LEVEL:
            if (!api_levels_.empty()) {
                selected_api_level_ = (selected_api_level_ + 1) % api_levels_.size();
            }
            break;
        case FormField::CATEGORY:
            selected_category_ = (selected_category_ + 1) % categories().size();
            apply_category_filter();
            break;
        case FormField::DEVICE_TYPE:
            if (!device_types_.empty()) {
                selected_device_type_ = (selected_device_type_ + 1) % device_types_.size();
            }
            break;
        default:
            return;
    }
    update_placeholder_name();
}

void CreateDeviceForm::select_prev() {
    switch (active_field()) {
        case FormField::API_LEVEL:
            if (!api_levels_.empty()) {
                selected_api_level_ = (selected_api_level_ + api_levels_.size() - 1) % api_levels_.size();
            }
            break;
        case FormField::CATEGORY:
            selected_category_ = (selected_category_ + categories().size() - 1) % categories().size();
            apply_category_filter();
            break;
        case FormField::DEVICE_TYPE:
            if (!device_types_.empty()) {
                selected_device_type_ = (selected_device_type_ + device_types_.size() - 1) % device_types_.size();
            }
            break;
        default:
            return;
    }
    update_placeholder_name();
}

std::string* CreateDeviceForm::active_text() {
    switch (active_field()) {
        case FormField::RAM_SIZE:     return &ram_size_;
        case FormField::STORAGE_SIZE: return &storage_size_;
        case FormField::NAME:         return &name_;
        default:                      return nullptr;
    }
}

void CreateDeviceForm::insert_char(char c) {
    std::string* text = active_text();
    if (!text || text->size() >= MAX_TEXT_LENGTH) {
        return;
    }

    bool numeric = active_field() != FormField::NAME;
    if (numeric && !std::isdigit(static_cast<unsigned char>(c))) {
        return;
    }
    if (!numeric && !std::isprint(static_cast<unsigned char>(c))) {
        return;
    }

    if (active_field() == FormField::NAME && !name_edited_) {
        // First keystroke replaces the placeholder
        name_.clear();
        name_edited_ = true;
    }
    *text += c;
    error_message.clear();
}

void CreateDeviceForm::backspace() {
    std::string* text = active_text();
    if (!text || text->empty()) {
        return;
    }
    if (active_field() == FormField::NAME) {
        name_edited_ = true;
    }
    text->pop_back();
    error_message.clear();
}

void CreateDeviceForm::set_choices(std::vector<Choice> device_types, std::vector<Choice> api_levels, bool stale) {
    std::string previous_level = selected_api_level_ < api_levels_.size()
        ? api_levels_[selected_api_level_].id : std::string();
    std::string previous_type = selected_device_type_ < device_types_.size()
        ? device_types_[selected_device_type_].id : std::string();

    api_levels_ = std::move(api_levels);
    all_device_types_ = std::move(device_types);
    stale_choices = stale;

    // Keep the user's picks when the reloaded lists still contain them
    selected_api_level_ = 0;
    for (size_t i = 0; i < api_levels_.size(); ++i) {
        if (api_levels_[i].id == previous_level) {
            selected_api_level_ = i;
            break;
        }
    }

    apply_category_filter();
    for (size_t i = 0; i < device_types_.size(); ++i) {
        if (device_types_[i].id == previous_type) {
            selected_device_type_ = i;
            break;
        }
    }
    update_placeholder_name();
}

void CreateDeviceForm::apply_category_filter() {
    if (platform_ == Platform::IOS) {
        device_types_ = all_device_types_;
    } else {
        device_types_ = filter_device_types(all_device_types_, category());
    }
    selected_device_type_ = 0;
}

void CreateDeviceForm::update_placeholder_name() {
    if (name_edited_) {
        return;
    }

    if (device_types_.empty() || api_levels_.empty()) {
        name_.clear();
        return;
    }

    const Choice& type = device_types_[selected_device_type_];
    const Choice& level = api_levels_[selected_api_level_];

    if (platform_ == Platform::ANDROID) {
        std::string name = type.display + " API " + level.id;
        // AVD names cannot contain spaces
        std::replace(name.begin(), name.end(), ' ', '_');
        name_ = name;
    } else {
        name_ = type.display + " " + level.display;
    }
}

std::string CreateDeviceForm::field_value(FormField field) const {
    switch (field) {
        case FormField::API_LEVEL:
            return selected_api_level_ < api_levels_.size() ? api_levels_[selected_api_level_].display : "";
        case FormField::CATEGORY:
            return category();
        case FormField::DEVICE_TYPE:
            return selected_device_type_ < device_types_.size() ? device_types_[selected_device_type_].display : "";
        case FormField::RAM_SIZE:
            return ram_size_;
        case FormField::STORAGE_SIZE:
            return storage_size_;
        case FormField::NAME:
            return name_;
    }
    return "";
}

std::optional<DeviceConfig> CreateDeviceForm::to_config(std::string& error) const {
    if (api_levels_.empty() || selected_api_level_ >= api_levels_.size()) {
        error = platform_ == Platform::ANDROID ? "No API level selected" : "No runtime selected";
        return std::nullopt;
    }
    if (device_types_.empty() || selected_device_type_ >= device_types_.size()) {
        error = "No device type selected";
        return std::nullopt;
    }

    std::string trimmed = name_;
    size_t first = trimmed.find_first_not_of(' ');
    size_t last = trimmed.find_last_not_of(' ');
    trimmed = first == std::string::npos ? "" : trimmed.substr(first, last - first + 1);
    if (trimmed.empty()) {
        error = "Device name cannot be empty";
        return std::nullopt;
    }

    DeviceConfig config;
    config.name = trimmed;
    config.device_type = device_types_[selected_device_type_].id;
    config.version = api_levels_[selected_api_level_].id;

    if (platform_ == Platform::ANDROID) {
        if (!ram_size_.empty()) {
            if (!is_number(ram_size_)) {
                error = "RAM size must be a number";
                return std::nullopt;
            }
            config.ram_size = ram_size_;
        }
        if (!storage_size_.empty()) {
            if (!is_number(storage_size_)) {
                error = "Storage size must be a number";
                return std::nullopt;
            }
            config.storage_size = storage_size_;
        }
    }
    return config;
}
