//X11_Backend.cc - A part of ClickAutomaton 2026.

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <X11/Xlib.h>
#include <X11/Xatom.h>
#include <X11/Xutil.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

#include "YgorMisc.h"
#include "YgorLog.h"

#include "Key_Names.h"
#include "Click_Settings.h"
#include "Input_Port.h"
#include "Hotkey_Recognizer.h"
#include "X11_Backend.h"


// Windows routinely disappear between enumeration and use. Xlib's default handler terminates the process on such
// (asynchronous) errors, so a non-fatal handler is installed instead.
static
int
x11_nonfatal_error_handler(Display *d, XErrorEvent *e){
    std::array<char, 256> buf;
    buf.fill('\0');
    XGetErrorText(d, e->error_code, buf.data(), static_cast<int>(buf.size() - 1));
    YLOGDEBUG("Ignoring X11 error: '" << buf.data() << "' (request " << static_cast<int>(e->request_code) << ")");
    return 0;
}

static
void
x11_initialize_once(){
    static std::once_flag flag;
    std::call_once(flag, [](){
        if(XInitThreads() == 0){
            YLOGWARN("Xlib could not be initialized for multi-threaded use");
        }
        XSetErrorHandler(x11_nonfatal_error_handler);
    });
    return;
}

void x11_display_closer_t::operator()(_XDisplay *d) const {
    if(d != nullptr) XCloseDisplay(d);
    return;
}

x11_display_ptr_t x11_open_display(){
    x11_initialize_once();
    x11_display_ptr_t d( XOpenDisplay(nullptr) );
    if(!d){
        throw std::runtime_error("Unable to open X display. Is DISPLAY set?");
    }
    return d;
}

static
std::vector<KeySym>
keysyms_for_key(key_id_t k){
    switch(k){
        case key_id_t::ShiftLeft:    return { XK_Shift_L };
        case key_id_t::ShiftRight:   return { XK_Shift_R };
        case key_id_t::ControlLeft:  return { XK_Control_L };
        case key_id_t::ControlRight: return { XK_Control_R };
        case key_id_t::Alt:          return { XK_Alt_L, XK_Meta_L };
        case key_id_t::AltGr:        return { XK_ISO_Level3_Shift, XK_Alt_R, XK_Mode_switch };
        case key_id_t::F1:  return { XK_F1 };
        case key_id_t::F2:  return { XK_F2 };
        case key_id_t::F3:  return { XK_F3 };
        case key_id_t::F4:  return { XK_F4 };
        case key_id_t::F5:  return { XK_F5 };
        case key_id_t::F6:  return { XK_F6 };
        case key_id_t::F7:  return { XK_F7 };
        case key_id_t::F8:  return { XK_F8 };
        case key_id_t::F9:  return { XK_F9 };
        case key_id_t::F10: return { XK_F10 };
        case key_id_t::F11: return { XK_F11 };
        case key_id_t::F12: return { XK_F12 };
        case key_id_t::Space:     return { XK_space };
        case key_id_t::Enter:     return { XK_Return, XK_KP_Enter };
        case key_id_t::Escape:    return { XK_Escape };
        case key_id_t::Tab:       return { XK_Tab };
        case key_id_t::Backspace: return { XK_BackSpace };
        case key_id_t::CapsLock:  return { XK_Caps_Lock };
        case key_id_t::Home:      return { XK_Home };
        case key_id_t::End:       return { XK_End };
        case key_id_t::PageUp:    return { XK_Prior };
        case key_id_t::PageDown:  return { XK_Next };
        case key_id_t::Insert:    return { XK_Insert };
        case key_id_t::Delete:    return { XK_Delete };
        case key_id_t::Up:        return { XK_Up };
        case key_id_t::Down:      return { XK_Down };
        case key_id_t::Left:      return { XK_Left };
        case key_id_t::Right:     return { XK_Right };
    }
    return {};
}

static
unsigned int
x11_button_number(mouse_button_t b){
    return (b == mouse_button_t::Right) ? Button3 : Button1;
}

// ---------------------------------------------------------------------------------------------------------------------

x11_input_port_t::x11_input_port_t() : display(x11_open_display()) {
    int event_base = 0;
    int error_base = 0;
    int major = 0;
    int minor = 0;
    if(!XTestQueryExtension(this->display.get(), &event_base, &error_base, &major, &minor)){
        throw std::runtime_error("X server does not support the XTest extension");
    }
    YLOGINFO("Using XTest extension version " << major << "." << minor);
}

void x11_input_port_t::fake(click_action_t a, bool down){
    std::lock_guard<std::mutex> lock(this->display_mutex);
    auto *d = this->display.get();

    int res = 0;
    if(a == click_action_t::SpaceKey){
        const auto kc = XKeysymToKeycode(d, XK_space);
        if(kc == 0) throw std::runtime_error("No keycode is mapped to the space key");
        res = XTestFakeKeyEvent(d, kc, down ? True : False, CurrentTime);
    }else{
        const auto b = (a == click_action_t::RightButton) ? mouse_button_t::Right : mouse_button_t::Left;
        res = XTestFakeButtonEvent(d, x11_button_number(b), down ? True : False, CurrentTime);
    }
    if(res == 0){
        throw std::runtime_error("XTest rejected the fake "_s + (down ? "press" : "release")
                                 + " of '" + click_action_to_string(a) + "'");
    }
    XFlush(d);
    return;
}

void x11_input_port_t::press(click_action_t a){
    this->fake(a, true);
    return;
}

void x11_input_port_t::release(click_action_t a){
    this->fake(a, false);
    return;
}

void x11_input_port_t::post_to_window(window_handle_t h, const window_message_t &m){
    std::lock_guard<std::mutex> lock(this->display_mutex);
    auto *d = this->display.get();
    const auto w = static_cast<Window>(h);
    const auto root = DefaultRootWindow(d);

    XEvent ev;
    std::memset(&ev, 0, sizeof(ev));
    long mask = 0;

    if(is_button_message(m)){
        const bool down = (m.kind == window_message_kind_t::ButtonDown);
        ev.type = down ? ButtonPress : ButtonRelease;
        mask = down ? ButtonPressMask : ButtonReleaseMask;

        auto &be = ev.xbutton;
        be.display = d;
        be.window = w;
        be.root = root;
        be.subwindow = None;
        be.time = CurrentTime;
        be.x = static_cast<int>(m.x);
        be.y = static_cast<int>(m.y);
        be.button = x11_button_number(m.button);
        be.state = down ? 0 : ((m.button == mouse_button_t::Right) ? Button3Mask : Button1Mask);
        be.same_screen = True;

        Window child = None;
        if(!XTranslateCoordinates(d, w, root, be.x, be.y, &be.x_root, &be.y_root, &child)){
            be.x_root = be.x;
            be.y_root = be.y;
        }

    }else{
        const bool down = (m.kind == window_message_kind_t::KeyDown);
        ev.type = down ? KeyPress : KeyRelease;
        mask = down ? KeyPressMask : KeyReleaseMask;

        const auto kc = XKeysymToKeycode(d, static_cast<KeySym>(m.key_code));
        if(kc == 0){
            throw std::runtime_error("No keycode is mapped to keysym " + std::to_string(m.key_code));
        }

        auto &ke = ev.xkey;
        ke.display = d;
        ke.window = w;
        ke.root = root;
        ke.subwindow = None;
        ke.time = CurrentTime;
        ke.x = 1;
        ke.y = 1;
        ke.x_root = 1;
        ke.y_root = 1;
        ke.state = 0;
        ke.keycode = kc;
        ke.same_screen = True;
    }

    if(XSendEvent(d, w, True, mask, &ev) == 0){
        throw std::runtime_error("XSendEvent failed for window " + std::to_string(h));
    }
    XFlush(d);
    return;
}

// ---------------------------------------------------------------------------------------------------------------------

static
std::optional<std::vector<Window>>
x11_get_window_list_property(Display *d, Window w, const char *prop_name){
    const auto prop = XInternAtom(d, prop_name, True);
    if(prop == None) return {};

    Atom actual_type = None;
    int actual_format = 0;
    unsigned long n_items = 0;
    unsigned long bytes_after = 0;
    unsigned char *data = nullptr;
    const auto res = XGetWindowProperty(d, w, prop, 0, 4096, False, XA_WINDOW,
                                        &actual_type, &actual_format, &n_items, &bytes_after, &data);
    if( (res != Success)
    ||  (actual_type != XA_WINDOW)
    ||  (actual_format != 32)
    ||  (data == nullptr) ){
        if(data != nullptr) XFree(data);
        return {};
    }

    // Format-32 properties are returned as arrays of long.
    std::vector<Window> out;
    const auto *items = reinterpret_cast<const unsigned long *>(data);
    for(unsigned long i = 0; i < n_items; ++i) out.push_back( static_cast<Window>(items[i]) );
    XFree(data);
    return out;
}

static
std::string
x11_get_window_title(Display *d, Window w){
    const auto net_wm_name = XInternAtom(d, "_NET_WM_NAME", True);
    const auto utf8_string = XInternAtom(d, "UTF8_STRING", True);
    if( (net_wm_name != None)
    &&  (utf8_string != None) ){
        Atom actual_type = None;
        int actual_format = 0;
        unsigned long n_items = 0;
        unsigned long bytes_after = 0;
        unsigned char *data = nullptr;
        const auto res = XGetWindowProperty(d, w, net_wm_name, 0, 1024, False, utf8_string,
                                            &actual_type, &actual_format, &n_items, &bytes_after, &data);
        if( (res == Success)
        &&  (data != nullptr) ){
            std::string out( reinterpret_cast<const char *>(data), n_items );
            XFree(data);
            if(!out.empty()) return out;
        }else if(data != nullptr){
            XFree(data);
        }
    }

    char *name = nullptr;
    if( (XFetchName(d, w, &name) != 0)
    &&  (name != nullptr) ){
        std::string out(name);
        XFree(name);
        return out;
    }
    return std::string();
}

static
bool
x11_is_desktop_window(Display *d, Window w){
    const auto wm_window_type = XInternAtom(d, "_NET_WM_WINDOW_TYPE", True);
    const auto type_desktop = XInternAtom(d, "_NET_WM_WINDOW_TYPE_DESKTOP", True);
    if( (wm_window_type == None)
    ||  (type_desktop == None) ){
        return false;
    }

    Atom actual_type = None;
    int actual_format = 0;
    unsigned long n_items = 0;
    unsigned long bytes_after = 0;
    unsigned char *data = nullptr;
    const auto res = XGetWindowProperty(d, w, wm_window_type, 0, 64, False, XA_ATOM,
                                        &actual_type, &actual_format, &n_items, &bytes_after, &data);
    bool is_desktop = false;
    if( (res == Success)
    &&  (data != nullptr)
    &&  (actual_format == 32) ){
        const auto *atoms = reinterpret_cast<const unsigned long *>(data);
        for(unsigned long i = 0; i < n_items; ++i){
            if(static_cast<Atom>(atoms[i]) == type_desktop) is_desktop = true;
        }
    }
    if(data != nullptr) XFree(data);
    return is_desktop;
}

x11_window_directory_t::x11_window_directory_t() : display(x11_open_display()) {}

std::vector<window_info_t> x11_window_directory_t::list_windows(){
    std::lock_guard<std::mutex> lock(this->display_mutex);
    auto *d = this->display.get();
    const auto root = DefaultRootWindow(d);

    auto candidates = x11_get_window_list_property(d, root, "_NET_CLIENT_LIST");
    if(!candidates){
        // No EWMH-compliant window manager, so fall back to the root's children.
        candidates.emplace();
        Window root_ret = None;
        Window parent_ret = None;
        Window *children = nullptr;
        unsigned int n_children = 0;
        if(XQueryTree(d, root, &root_ret, &parent_ret, &children, &n_children) != 0){
            for(unsigned int i = 0; i < n_children; ++i) candidates->push_back(children[i]);
        }
        if(children != nullptr) XFree(children);
    }

    std::vector<window_info_t> out;
    for(const auto &w : candidates.value()){
        XWindowAttributes attrs;
        if(XGetWindowAttributes(d, w, &attrs) == 0) continue;
        if(attrs.map_state != IsViewable) continue;
        if(x11_is_desktop_window(d, w)) continue;

        auto title = x11_get_window_title(d, w);
        if(title.empty()) continue;

        window_info_t wi;
        wi.handle = static_cast<window_handle_t>(w);
        wi.title = std::move(title);
        out.push_back(wi);
    }
    return out;
}

std::optional<client_extent_t> x11_window_directory_t::client_extent(window_handle_t h){
    std::lock_guard<std::mutex> lock(this->display_mutex);
    XWindowAttributes attrs;
    if(XGetWindowAttributes(this->display.get(), static_cast<Window>(h), &attrs) == 0) return {};

    client_extent_t e;
    e.width = attrs.width;
    e.height = attrs.height;
    return e;
}

// ---------------------------------------------------------------------------------------------------------------------

std::vector<key_id_t> keys_down_in_keymap(const std::array<char, 32> &keymap,
                                          const std::vector<std::pair<key_id_t, std::vector<unsigned char>>> &keycodes){
    std::vector<key_id_t> out;
    for(const auto &kc : keycodes){
        for(const auto &c : kc.second){
            const auto byte = static_cast<unsigned char>(keymap.at(c / 8));
            if( (byte & (1U << (c % 8))) != 0U ){
                out.push_back(kc.first);
                break;
            }
        }
    }
    return out;
}

x11_key_listener_t::x11_key_listener_t(callback_t f,
                                       std::chrono::milliseconds poll_interval,
                                       std::chrono::milliseconds start_delay)
    : callback(std::move(f)),
      poll_interval(poll_interval),
      start_delay(start_delay),
      display(x11_open_display()) {

    if(!this->callback){
        throw std::invalid_argument("Key listener requires a callback");
    }

    for(const auto &kn : key_name_table()){
        std::vector<unsigned char> codes;
        for(const auto &ks : keysyms_for_key(kn.key)){
            const auto kc = XKeysymToKeycode(this->display.get(), ks);
            if(kc != 0) codes.push_back(static_cast<unsigned char>(kc));
        }
        if(codes.empty()){
            YLOGDEBUG("Key '" << kn.display_name << "' is not mapped on this keyboard");
            continue;
        }
        this->keycodes.emplace_back(kn.key, codes);
    }
}

x11_key_listener_t::~x11_key_listener_t(){
    this->stop();
}

bool x11_key_listener_t::wait(std::chrono::milliseconds d){
    std::unique_lock<std::mutex> lock(this->quit_mutex);
    this->quit_notifier.wait_for(lock, d, [this](){ return this->should_quit.load(); });
    return !this->should_quit.load();
}

void x11_key_listener_t::start(){
    if(this->worker.joinable()){
        throw std::logic_error("Key listener already started");
    }
    this->should_quit.store(false);
    this->worker = std::thread([this](){
        if(!this->wait(this->start_delay)) return;
        YLOGINFO("Global key listener started");

        std::vector<key_id_t> prev;
        bool primed = false;
        while(this->wait(this->poll_interval)){
            std::array<char, 32> keymap;
            keymap.fill(0);
            XQueryKeymap(this->display.get(), keymap.data());
            auto now = keys_down_in_keymap(keymap, this->keycodes);

            // Keys already held when listening begins are not reported as presses.
            if(primed){
                for(const auto &k : prev){
                    if(std::find(std::begin(now), std::end(now), k) != std::end(now)) continue;
                    key_event_t e;
                    e.kind = key_event_kind_t::Release;
                    e.key = k;
                    try{
                        this->callback(e);
                    }catch(const std::exception &ex){
                        YLOGWARN("Key release handler failed: " << ex.what());
                    }
                }
                for(const auto &k : now){
                    if(std::find(std::begin(prev), std::end(prev), k) != std::end(prev)) continue;
                    key_event_t e;
                    e.kind = key_event_kind_t::Press;
                    e.key = k;
                    try{
                        this->callback(e);
                    }catch(const std::exception &ex){
                        YLOGWARN("Key press handler failed: " << ex.what());
                    }
                }
            }
            primed = true;
            prev = std::move(now);
        }
        YLOGINFO("Global key listener stopped");
    });
    return;
}

void x11_key_listener_t::stop(){
    {
        std::lock_guard<std::mutex> lock(this->quit_mutex);
        this->should_quit.store(true);
        this->quit_notifier.notify_all();
    }
    if(this->worker.joinable()){
        this->worker.join();
    }
    return;
}

