/*
 * create_form.hpp - Device creation form
 *
 * Holds the fields of the create-device dialog. Android devices take an API
 * level, a category filter, a device type, RAM and storage sizes and a
 * name; iOS simulators only need a runtime, a device type and a name.
 *
 * List fields are filled from the DeviceCache. Until the user types a name
 * the form keeps a placeholder generated from the chosen type and version.
 */

#pragma once

#include "device.hpp"
#include <optional>
#include <string>
#include <vector>

enum class FormField { API_LEVEL, CATEGORY, DEVICE_TYPE, RAM_SIZE, STORAGE_SIZE, NAME };

const char* form_field_label(FormField field);

class CreateDeviceForm {
public:
    static constexpr const char* DEFAULT_RAM = "2048";
    static constexpr const char* DEFAULT_STORAGE = "8192";
    static constexpr size_t MAX_TEXT_LENGTH = 64;

    explicit CreateDeviceForm(Platform platform);

    static const std::vector<std::string>& categories();

    Platform platform() const { return platform_; }
    const std::vector<FormField>& fields() const { return fields_; }
    FormField active_field() const { return fields_[active_field_]; }

    void next_field();
    void prev_field();

    // Cycle the option of the active list field
    void select_next();
    void select_prev();

    // Text editing on the active text field
    void insert_char(char c);
    void backspace();

    void set_choices(std::vector<Choice> device_types, std::vector<Choice> api_levels, bool stale);
    bool has_choices() const { return !api_levels_.empty() || !all_device_types_.empty(); }

    const std::vector<Choice>& api_levels() const { return api_levels_; }
    const std::vector<Choice>& device_types() const { return device_types_; }
    size_t selected_api_level() const { return selected_api_level_; }
    size_t selected_device_type() const { return selected_device_type_; }
    const std::string& category() const { return categories()[selected_category_]; }
    const std::string& ram_size() const { return ram_size_; }
    const std::string& storage_size() const { return storage_size_; }
    const std::string& name() const { return name_; }
    bool name_edited() const { return name_edited_; }

    std::string field_value(FormField field) const;

    // Builds the configuration, or reports why the form cannot be submitted
    std::optional<DeviceConfig> to_config(std::string& error) const;

    // Submission and loading state
    std::string error_message;
    bool is_creating = false;
    bool is_loading = false;
    bool stale_choices = false;

private:
    Platform platform_;
    std::vector<FormField> fields_;
    size_t active_field_ = 0;

    std::vector<Choice> api_levels_;
    size_t selected_api_level_ = 0;
    std::vector<Choice> all_device_types_;
    std::vector<Choice> device_types_;
    size_t selected_device_type_ = 0;
    size_t selected_category_ = 0;

    std::string ram_size_ = DEFAULT_RAM;
    std::string storage_size_ = DEFAULT_STORAGE;
    std::string name_;
    bool name_edited_ = false;

    void apply_category_filter();
    void update_placeholder_name();
    std::string* active_text();
};

// Filters device types by category keyword. "all" keeps everything and
// "phone" keeps whatever matches none of the other categories.
std::vector<Choice> filter_device_types(const std::vector<Choice>& types, const std::string& category);
