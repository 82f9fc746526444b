// =============================================================================
// DroidPilot - App catalogue
// =============================================================================
#include "app_catalog.hpp"

#include "../util/string_util.hpp"

namespace droidpilot::agent {

AppCatalog::AppCatalog() {
    addAll({
        {"微信", "com.tencent.mm"},
        {"wechat", "com.tencent.mm"},
        {"支付宝", "com.eg.android.AlipayGphone"},
        {"alipay", "com.eg.android.AlipayGphone"},
        {"淘宝", "com.taobao.taobao"},
        {"taobao", "com.taobao.taobao"},
        {"抖音", "com.ss.android.ugc.aweme"},
        {"douyin", "com.ss.android.ugc.aweme"},
        {"tiktok", "com.ss.android.ugc.aweme"},
        {"bilibili", "tv.danmaku.bili"},
        {"b站", "tv.danmaku.bili"},
        {"哔哩哔哩", "tv.danmaku.bili"},
        {"高德地图", "com.autonavi.minimap"},
        {"amap", "com.autonavi.minimap"},
        {"百度地图", "com.baidu.BaiduMap"},
        {"baidu maps", "com.baidu.BaiduMap"},
        {"美团", "com.sankuai.meituan"},
        {"meituan", "com.sankuai.meituan"},
        {"饿了么", "me.ele"},
        {"eleme", "me.ele"},
        {"京东", "com.jingdong.app.mall"},
        {"jd", "com.jingdong.app.mall"},
        {"拼多多", "com.xunmeng.pinduoduo"},
        {"pinduoduo", "com.xunmeng.pinduoduo"},
        {"网易云音乐", "com.netease.cloudmusic"},
        {"qq音乐", "com.tencent.qqmusic"},
        {"qq music", "com.tencent.qqmusic"},
        {"qq", "com.tencent.mobileqq"},
        {"小红书", "com.xingin.xhs"},
        {"xiaohongshu", "com.xingin.xhs"},
        {"设置", "com.android.settings"},
        {"settings", "com.android.settings"},
        {"相机", "com.android.camera"},
        {"camera", "com.android.camera"},
        {"浏览器", "com.android.browser"},
        {"browser", "com.android.browser"},
        {"chrome", "com.android.chrome"},
    });
}

void AppCatalog::add(const std::string& name, const std::string& package) {
    std::string key = util::toLower(util::trim(name));
    if (key.empty() || package.empty()) return;
    packages_[key] = package;
}

void AppCatalog::addAll(const std::map<std::string, std::string>& entries) {
    for (const auto& [name, package] : entries) add(name, package);
}

bool AppCatalog::looksLikePackage(const std::string& id) {
    return !id.empty() && id.find('.') != std::string::npos && id.find(' ') == std::string::npos &&
           id.front() != '.' && id.back() != '.';
}

std::optional<std::string> AppCatalog::resolve(const std::string& name) const {
    std::string trimmed = util::trim(name);
    if (trimmed.empty()) return std::nullopt;
    auto it = packages_.find(util::toLower(trimmed));
    if (it != packages_.end()) return it->second;
    if (looksLikePackage(trimmed)) return trimmed;
    return std::nullopt;
}

} // namespace droidpilot::agent
