#include <catch2/catch_test_macros.hpp>

#include <string.h>

#include <lvGUI/core/api/lvGUI.hpp>

#include "GuiFixture.hpp"

using namespace lvgui;

namespace
{
    template <typename W>
    W make(lvtest::GuiFixture &gui)
    {
        Result<W> w = W::create(gui.screen());
        REQUIRE(w.ok());
        return w.take();
    }

    bool same(const char *a, const char *b)
    {
        return a && b && strcmp(a, b) == 0;
    }
}

TEST_CASE("Text widgets", "[widgets]")
{
    lvtest::GuiFixture gui;

    SECTION("Label")
    {
        Label label = make<Label>(gui);
        label.setText("hello");
        REQUIRE(same(label.text(), "hello"));

        label.setTextFmt("%d of %s", 3, "five");
        REQUIRE(same(label.text(), "3 of five"));

        static const char fixed[] = "static";
        label.setTextStatic(fixed);
        REQUIRE(label.text() == fixed);

        label.destroy();
        REQUIRE(same(label.text(), ""));
        label.setText("ignored");
    }

    SECTION("Checkbox")
    {
        Checkbox box = make<Checkbox>(gui);
        box.setText("Agree");
        REQUIRE(same(box.text(), "Agree"));
        REQUIRE_FALSE(box.isChecked());
        box.setChecked(true);
        REQUIRE(box.isChecked());
        REQUIRE(box.hasState(State::Checked));
    }

    SECTION("Textarea")
    {
        Textarea ta = make<Textarea>(gui);
        ta.setText("ab");
        ta.addText("c");
        REQUIRE(same(ta.text(), "abc"));
        ta.deleteChar();
        REQUIRE(same(ta.text(), "ab"));

        ta.setText("");
        ta.setAcceptedChars("0123456789");
        ta.addText("a1b2");
        REQUIRE(same(ta.text(), "12"));
    }

    SECTION("Button label")
    {
        Result<Button> btn = Button::createWithLabel(gui.screen(), "OK");
        REQUIRE(btn.ok());
        REQUIRE(btn->childCount() == 1);
        REQUIRE(same(btn->labelText(), "OK"));
        REQUIRE(btn->setLabelText("Go"));
        REQUIRE(same(btn->labelText(), "Go"));

        Button bare = make<Button>(gui);
        REQUIRE_FALSE(bare.setLabelText("nothing"));
        REQUIRE(same(bare.labelText(), ""));
    }
}

TEST_CASE("Value widgets", "[widgets]")
{
    lvtest::GuiFixture gui;

    SECTION("Slider clamps to its range")
    {
        Slider slider = make<Slider>(gui);
        slider.setRange(0, 50);
        REQUIRE(slider.minValue() == 0);
        REQUIRE(slider.maxValue() == 50);

        slider.setValue(20);
        REQUIRE(slider.value() == 20);
        slider.setValue(80);
        REQUIRE(slider.value() == 50);
        slider.setValue(-5);
        REQUIRE(slider.value() == 0);
        REQUIRE_FALSE(slider.isDragged());
    }

    SECTION("Bar and arc")
    {
        Bar bar = make<Bar>(gui);
        bar.setRange(10, 20);
        bar.setValue(5);
        REQUIRE(bar.value() == 10);

        Arc arc = make<Arc>(gui);
        arc.setRange(0, 10);
        arc.setValue(7, true);
        REQUIRE(arc.value() == 7);
        arc.setValue(11);
        REQUIRE(arc.value() == 10);
        REQUIRE(arc.maxValue() == 10);
    }

    SECTION("Switch")
    {
        Switch sw = make<Switch>(gui);
        REQUIRE_FALSE(sw.isChecked());
        sw.setChecked(true);
        REQUIRE(sw.isChecked());
        sw.setChecked(false);
        REQUIRE_FALSE(sw.isChecked());
    }

    SECTION("Led")
    {
        Led led = make<Led>(gui);
        led.setBrightness(100);
        REQUIRE(led.brightness() == 100);
        led.on();
        REQUIRE(led.brightness() == LV_LED_BRIGHT_MAX);
        led.off();
        REQUIRE(led.brightness() == LV_LED_BRIGHT_MIN);
    }

    SECTION("Spinbox steps within its range")
    {
        Spinbox spin = make<Spinbox>(gui);
        spin.setDigitFormat(3, 0);
        spin.setRange(0, 100);
        spin.setStep(1);
        spin.setValue(5);
        spin.increment();
        REQUIRE(spin.value() == 6);
        spin.decrement();
        spin.decrement();
        REQUIRE(spin.value() == 4);
        spin.setValue(500);
        REQUIRE(spin.value() == 100);
    }

    SECTION("Stale value widgets read as zero")
    {
        Slider slider = make<Slider>(gui);
        slider.setValue(30);
        slider.destroy();
        slider.setValue(10);
        REQUIRE(slider.value() == 0);
        REQUIRE(slider.maxValue() == 0);
    }
}

TEST_CASE("Option widgets", "[widgets]")
{
    lvtest::GuiFixture gui;
    char buf[16];

    SECTION("Dropdown")
    {
        Dropdown dd = make<Dropdown>(gui);
        dd.setOptions("Low\nMedium\nHigh");
        REQUIRE(dd.optionCount() == 3);

        dd.setSelected(1);
        REQUIRE(dd.selected() == 1);
        dd.selectedText(buf, sizeof(buf));
        REQUIRE(same(buf, "Medium"));

        dd.addOption("Max");
        REQUIRE(dd.optionCount() == 4);
    }

    SECTION("Roller")
    {
        Roller roller = make<Roller>(gui);
        roller.setOptions("x\ny\nz");
        REQUIRE(roller.optionCount() == 3);
        roller.setSelected(2, true);
        REQUIRE(roller.selected() == 2);
        roller.selectedText(buf, sizeof(buf));
        REQUIRE(same(buf, "z"));
    }

    SECTION("Stale lists leave the buffer empty")
    {
        Roller roller = make<Roller>(gui);
        roller.destroy();
        strcpy(buf, "junk");
        roller.selectedText(buf, sizeof(buf));
        REQUIRE(same(buf, ""));
        REQUIRE(roller.optionCount() == 0);
    }
}

TEST_CASE("Container widgets", "[widgets]")
{
    lvtest::GuiFixture gui;

    SECTION("Table grows to fit")
    {
        Table table = make<Table>(gui);
        table.setCellValue(2, 1, "x");
        REQUIRE(table.rowCount() == 3);
        REQUIRE(table.columnCount() == 2);
        REQUIRE(same(table.cellValue(2, 1), "x"));
        REQUIRE(same(table.cellValue(9, 9), ""));
    }

    SECTION("List")
    {
        List list = make<List>(gui);
        Obj header = list.addText("Section");
        REQUIRE(header.isValid());

        Button item = list.addButton(nullptr, "Item");
        REQUIRE(item.isValid());
        REQUIRE(item.parent() == list);
        REQUIRE(same(list.buttonText(item), "Item"));
        REQUIRE(same(list.buttonText(Obj()), ""));
    }

    SECTION("Tabview")
    {
        Tabview tabs = make<Tabview>(gui);
        Obj first = tabs.addTab("One");
        Obj second = tabs.addTab("Two");
        REQUIRE(first.isValid());
        REQUIRE(second.isValid());
        REQUIRE(tabs.tabCount() == 2);
        REQUIRE(first.parent() == tabs.content());

        tabs.setActive(1);
        REQUIRE(tabs.active() == 1);
    }

    SECTION("Msgbox on a screen")
    {
        Result<Msgbox> box = Msgbox::create(gui.screen());
        REQUIRE(box.ok());
        Obj text = box->addText("Body");
        Button ok = box->addFooterButton("OK");
        REQUIRE(text.isValid());
        REQUIRE(ok.isValid());
        REQUIRE(same(ok.labelText(), "OK"));

        box->close();
        REQUIRE_FALSE(box->isValid());
        REQUIRE_FALSE(text.isValid());
        REQUIRE_FALSE(ok.isValid());
    }

    SECTION("Modal msgbox")
    {
        Result<Msgbox> box = Msgbox::createModal(gui.runtime);
        REQUIRE(box.ok());
        REQUIRE(box->addTitle("Title").isValid());
        Button close = box->addCloseButton();
        REQUIRE(close.isValid());

        Obj backdrop = box->parent();
        REQUIRE(backdrop.isValid());
        REQUIRE(backdrop.parent() == gui.runtime.topLayer());

        box->close();
        REQUIRE_FALSE(box->isValid());
        REQUIRE_FALSE(close.isValid());
        REQUIRE_FALSE(backdrop.isValid());
    }
}

TEST_CASE("Data widgets", "[widgets]")
{
    lvtest::GuiFixture gui;

    SECTION("Chart")
    {
        Chart chart = make<Chart>(gui);
        chart.setType(ChartType::Bar);
        chart.setPointCount(10);
        REQUIRE(chart.pointCount() == 10);
        chart.setAxisRange(ChartAxis::PrimaryY, 0, 100);

        ChartSeries series = chart.addSeries(Color::palette(LV_PALETTE_RED));
        REQUIRE(series.valid());
        chart.setNextValue(series, 42);
        chart.setAllValues(series, 7);
        chart.refresh();

        chart.destroy();
        REQUIRE_FALSE(chart.addSeries(Color::black()).valid());
        chart.setNextValue(series, 1);
    }

    SECTION("Buttonmatrix")
    {
        static const char *map[] = {"A", "B", "\n", "C", ""};
        Buttonmatrix matrix = make<Buttonmatrix>(gui);
        matrix.setMap(map);
        REQUIRE(same(matrix.buttonText(0), "A"));
        REQUIRE(same(matrix.buttonText(2), "C"));
        REQUIRE(matrix.selectedButton() == LV_BUTTONMATRIX_BUTTON_NONE);
    }

    SECTION("Keyboard")
    {
        Textarea ta = make<Textarea>(gui);
        Keyboard kb = make<Keyboard>(gui);
        kb.setTextarea(ta);
        REQUIRE(lv_keyboard_get_textarea(kb.raw()) == ta.raw());
        kb.setMode(KeyboardMode::Number);
        REQUIRE(kb.mode() == KeyboardMode::Number);
    }

    SECTION("Calendar")
    {
        Calendar cal = make<Calendar>(gui);
        cal.setTodayDate(2024, 3, 15);
        cal.setShowedDate(2024, 3);
        REQUIRE(cal.addHeaderArrow().isValid());

        CalendarDate date;
        REQUIRE_FALSE(cal.pressedDate(date));
    }

    SECTION("Remaining kinds build")
    {
        REQUIRE(Spinner::create(gui.screen()).ok());
        REQUIRE(Image::create(gui.screen()).ok());
        REQUIRE(Line::create(gui.screen()).ok());
        REQUIRE(Scale::create(gui.screen()).ok());
        REQUIRE(Canvas::create(gui.screen()).ok());
    }

    SECTION("Widgets render")
    {
        make<Slider>(gui).center();
        make<Arc>(gui).align(Align::TopLeft);
        gui.display->refreshNow();
        REQUIRE(gui.display->flushCount() > 0);
        REQUIRE(gui.display->readyCount() == gui.display->flushCount());
    }
}

TEST_CASE("Typed views of generic handles", "[widgets]")
{
    lvtest::GuiFixture gui;

    Label label = make<Label>(gui);
    label.setText("typed");

    Obj generic = label;
    REQUIRE(generic == label);

    Label view = Label::from(generic);
    REQUIRE(same(view.text(), "typed"));
    REQUIRE(view.parent() == gui.screen());

    Label empty;
    REQUIRE_FALSE(empty.isValid());
    REQUIRE(same(empty.text(), ""));

    SECTION("A view of the wrong class is empty")
    {
        Slider slider = Slider::from(generic);
        REQUIRE_FALSE(slider.isValid());
        REQUIRE(slider.value() == 0);
        slider.setValue(10);
        REQUIRE(same(label.text(), "typed"));

        REQUIRE_FALSE(Label::from(gui.screen()).isValid());
        REQUIRE_FALSE(Label::from(Obj()).isValid());
    }

    SECTION("Derived classes pass as their base")
    {
        Spinner spinner = make<Spinner>(gui);
        REQUIRE(Arc::from(spinner).isValid());
        REQUIRE_FALSE(Spinner::from(make<Arc>(gui)).isValid());

        List list = make<List>(gui);
        Button item = list.addButton(nullptr, "item");
        REQUIRE(item.isValid());
        REQUIRE(Button::from(item) == item);
    }
}
