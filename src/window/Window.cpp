#include "juicebox/window/Window.hpp"
#include "juicebox/display/Connection.hpp"
#include "juicebox/protocol/Wire.hpp"

namespace juicebox {

using namespace protocol;

Window::Window(WindowId id, Connection& connection)
    : id_(id), connection_(&connection) {}

Window Window::create(Connection& connection, const Screen& screen, const CreateOptions& options) {
    Window window(connection.generateId(), connection);

    auto list = makeValueList({
        {window_attribute::BackPixel, screen.black_pixel},
        {window_attribute::EventMask, options.event_mask},
    });

    CreateWindowRequest request{};
    request.length = requestLength(sizeof(request) + list.values.size() * 4);
    request.wid = window.id_;
    request.parent = screen.root;
    request.x = options.x;
    request.y = options.y;
    request.width = options.width;
    request.height = options.height;
    request.border_width = options.border_width;
    request.visual = screen.root_visual;
    request.value_mask = list.mask;

    RequestBuffer buffer;
    buffer.put(request);
    buffer.putValues(list.values);
    connection.send(buffer);

    if (options.title.has_value()) {
        window.changeProperty(PropertyMode::Replace, atom::WM_NAME, *options.title);
    }

    window.map();
    return window;
}

void Window::changeAttributes(std::vector<ValueMask> values) const {
    auto list = makeValueList(std::move(values));

    ChangeWindowAttributesRequest request{};
    request.length = requestLength(sizeof(request) + list.values.size() * 4);
    request.window = id_;
    request.value_mask = list.mask;

    RequestBuffer buffer;
    buffer.put(request);
    buffer.putValues(list.values);
    connection_->send(buffer);
}

void Window::configure(std::vector<ValueMask> values) const {
    auto list = makeValueList(std::move(values));

    ConfigureWindowRequest request{};
    request.length = requestLength(sizeof(request) + list.values.size() * 4);
    request.window = id_;
    request.value_mask = static_cast<std::uint16_t>(list.mask);

    RequestBuffer buffer;
    buffer.put(request);
    buffer.putValues(list.values);
    connection_->send(buffer);
}

void Window::map() const {
    MapWindowRequest request{};
    request.window = id_;
    connection_->send(request);
}

void Window::unMap() const {
    UnmapWindowRequest request{};
    request.window = id_;
    connection_->send(request);
}

void Window::inputFocus() const {
    SetInputFocusRequest request{};
    request.focus = id_;
    connection_->send(request);
}

void Window::close() const {
    KillClientRequest request{};
    request.resource = id_;
    connection_->send(request);
}

void Window::changeProperty(PropertyMode mode, Atom property, const Property& value) const {
    ChangePropertyRequest request{};
    request.mode = static_cast<std::uint8_t>(mode);
    request.window = id_;
    request.property = property;

    RequestBuffer payload;
    if (const auto* text = std::get_if<std::string>(&value)) {
        request.type = atom::STRING;
        request.format = 8;
        request.data_len = static_cast<std::uint32_t>(text->size());
        payload.putString(*text);
    } else {
        request.type = atom::INTEGER;
        request.format = 32;
        request.data_len = 1;
        payload.put(std::get<std::uint32_t>(value));
    }
    payload.align();

    request.length = requestLength(sizeof(request) + payload.size());

    RequestBuffer buffer;
    buffer.put(request);
    buffer.putBytes(payload.bytes().data(), payload.size());
    connection_->send(buffer);
}

GContext Window::createContext(std::vector<ValueMask> values) const {
    GContext context = connection_->generateId();
    auto list = makeValueList(std::move(values));

    CreateGCRequest request{};
    request.length = requestLength(sizeof(request) + list.values.size() * 4);
    request.cid = context;
    request.drawable = id_;
    request.value_mask = list.mask;

    RequestBuffer buffer;
    buffer.put(request);
    buffer.putValues(list.values);
    connection_->send(buffer);

    return context;
}

}
